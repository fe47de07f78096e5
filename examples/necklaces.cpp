/**
 * Necklace Enumeration Example
 *
 * Demonstrates:
 * - Fixed-content necklaces over symbol indices
 * - Counting necklaces by period
 * - Necklaces over an arbitrary ordered bead type
 */

#include <funcstructs/necklaces.hpp>
#include <iostream>
#include <string>

using namespace funcstructs;

int main() {
    std::cout << "=== Necklace Enumeration Example ===\n\n";

    NecklaceGenerator necklaces({2, 2, 2});
    std::cout << "Necklaces with two each of 0, 1, 2:\n";
    while (auto necklace = necklaces.next()) {
        std::cout << "  ";
        for (Symbol s : *necklace) std::cout << s;
        std::cout << "  period " << necklace->period() << "\n";
    }

    std::cout << "\nBy period:\n";
    for (const auto& [period, count] : necklaces.count_by_period()) {
        std::cout << "  period " << period << ": " << count << "\n";
    }

    std::cout << "\nArrangements of r, r, g, b around a ring:\n";
    FixedContentNecklaces<std::string> colours({"r", "g", "r", "b"});
    while (auto necklace = colours.next()) {
        std::cout << "  ";
        for (const auto& bead : *necklace) std::cout << bead << " ";
        std::cout << "\n";
    }
    return 0;
}
