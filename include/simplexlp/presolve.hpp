#ifndef SIMPLEXLP_PRESOLVE_HPP
#define SIMPLEXLP_PRESOLVE_HPP

#include <simplexlp/structs.hpp>
#include <string>

namespace SimplexLP {

    enum class PresolveStatus { Reduced, Infeasible, Unbounded };

    struct PresolveResult {
        PresolveStatus status = PresolveStatus::Reduced;
        Matrix A;
        Vector b, c;
        // original row / column of every kept row / column
        std::vector<Index> rows, cols;
        // values of the removed columns; +inf marks the column that makes the problem unbounded
        Vector fixed;
        std::string message;
    };

    /**
     * Removes zero rows, zero columns and singleton rows of A z = b, z >= 0 until
     * none are left. Detects trivial infeasibility and unboundedness on the way.
     * Running it on its own output removes nothing.
     */
    PresolveResult presolve(const Matrix &A, const Vector &b, const Vector &c, double tol);

    // Keeps every row and column; used when presolve is disabled.
    PresolveResult identity_presolve(const Matrix &A, const Vector &b, const Vector &c);

} // namespace SimplexLP

#endif // SIMPLEXLP_PRESOLVE_HPP
