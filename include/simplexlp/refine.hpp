#ifndef SIMPLEXLP_REFINE_HPP
#define SIMPLEXLP_REFINE_HPP

#include <simplexlp/structs.hpp>
#include <optional>

namespace SimplexLP {

    /**
     * Recomputes the values of the basic columns of A z = b from the normal
     * equations B^T B z_B = B^T b, where B holds the basic columns of A.
     *
     * Returns the full vector (nonbasic columns 0), or std::nullopt when the
     * factorization fails, the residual exceeds sqrt(tol) * (1 + |b|_inf), or a
     * value is below -sqrt(tol).
     */
    std::optional<Vector> refine_basic_solution(const Matrix &A, const Vector &b,
                                                const std::vector<Index> &basis, bool sparse, double tol);

} // namespace SimplexLP

#endif // SIMPLEXLP_REFINE_HPP
