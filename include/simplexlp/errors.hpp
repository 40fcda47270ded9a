#ifndef SIMPLEXLP_ERRORS_HPP
#define SIMPLEXLP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace SimplexLP {
    // Shapes of c, A_ub, b_ub, A_eq, b_eq or bounds disagree.
    class DimensionError : public std::invalid_argument {
      public:
        explicit DimensionError(const std::string &what) : std::invalid_argument(what) {}
    };

    // lower > upper, lower == +inf, upper == -inf or NaN.
    class InvalidBoundsError : public std::invalid_argument {
      public:
        explicit InvalidBoundsError(const std::string &what) : std::invalid_argument(what) {}
    };
} // namespace SimplexLP

#endif // SIMPLEXLP_ERRORS_HPP
