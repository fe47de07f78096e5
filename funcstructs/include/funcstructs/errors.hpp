#ifndef FUNCSTRUCTS_ERRORS_HPP
#define FUNCSTRUCTS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace funcstructs {

// Caller handed a generator or value type parameters it cannot accept.
// Always thrown from a constructor, before anything is emitted.
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& message)
        : std::invalid_argument("Invalid parameter: " + message) {}
};

// A word whose elements admit no total order cannot be put in necklace form.
class NotOrderable : public std::domain_error {
public:
    explicit NotOrderable(const std::string& message)
        : std::domain_error("Not orderable: " + message) {}
};

} // namespace funcstructs

#endif // FUNCSTRUCTS_ERRORS_HPP
