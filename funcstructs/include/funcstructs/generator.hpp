#ifndef FUNCSTRUCTS_GENERATOR_HPP
#define FUNCSTRUCTS_GENERATOR_HPP

#include <cstddef>
#include <utility>
#include <vector>

namespace funcstructs {

// Every generator in this library is a plain copyable value exposing
//
//   using value_type = ...;
//   std::optional<value_type> next();   // nullopt once exhausted
//   void reset();                       // restart from the first value
//
// A copy continues independently from the point it was taken. One
// instance must not be stepped from more than one thread at a time.

// Drain a copy of the generator into a vector.
template<typename Generator>
std::vector<typename Generator::value_type> collect(Generator generator) {
    std::vector<typename Generator::value_type> values;
    while (auto value = generator.next()) {
        values.push_back(std::move(*value));
    }
    return values;
}

// Number of values a copy of the generator produces.
template<typename Generator>
std::size_t count_values(Generator generator) {
    std::size_t count = 0;
    while (generator.next()) {
        ++count;
    }
    return count;
}

} // namespace funcstructs

#endif // FUNCSTRUCTS_GENERATOR_HPP
