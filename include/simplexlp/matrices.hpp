#ifndef SIMPLEXLP_MATRICES_HPP
#define SIMPLEXLP_MATRICES_HPP

#include <simplexlp/structs.hpp>

namespace SimplexLP {
    Matrix select_columns(const Matrix &, const std::vector<Index> &);

    Matrix select_rows(const Matrix &, const std::vector<Index> &);

    Matrix construct_block(const std::vector<std::vector<Matrix>> &);

    Matrix construct_diag(const Vector &);

    std::vector<Eigen::Triplet<double>> to_triplets(const Matrix &);
} // namespace SimplexLP

#endif // SIMPLEXLP_MATRICES_HPP
