#include <simplexlp/matrices.hpp>

#include <stdexcept>
#include <unordered_map>

namespace SimplexLP {
    Matrix select_columns(const Matrix &matr, const std::vector<Index> &columns) {
        std::vector<Eigen::Triplet<double>> triplets;

        for (size_t i = 0; i < columns.size(); ++i) {
            for (Matrix::InnerIterator it(matr, columns[i]); it; ++it) {
                triplets.emplace_back(it.row(), i, it.value());
            }
        }

        Matrix res(matr.rows(), columns.size());
        res.setFromTriplets(triplets.begin(), triplets.end());
        return res;
    }

    Matrix select_rows(const Matrix &matr, const std::vector<Index> &rows) {
        std::unordered_map<Index, Index> position;
        for (size_t i = 0; i < rows.size(); ++i) {
            position.emplace(rows[i], i);
        }

        std::vector<Eigen::Triplet<double>> triplets;
        for (Index col = 0; col < matr.outerSize(); ++col) {
            for (Matrix::InnerIterator it(matr, col); it; ++it) {
                auto found = position.find(it.row());
                if (found != position.end()) {
                    triplets.emplace_back(found->second, col, it.value());
                }
            }
        }

        Matrix res(rows.size(), matr.cols());
        res.setFromTriplets(triplets.begin(), triplets.end());
        return res;
    }

    Matrix construct_block(const std::vector<std::vector<Matrix>> &blocks) {
        std::vector<Eigen::Triplet<double>> triplets;
        Index cnt_rows = 0;
        Index cnt_cols = 0;
        for (size_t i = 0; i < blocks.size(); ++i) {
            cnt_rows += blocks[i][0].rows();
        }
        for (size_t i = 0; i < blocks[0].size(); ++i) {
            cnt_cols += blocks[0][i].cols();
        }

        Matrix res(cnt_rows, cnt_cols);

        Index seen_rows = 0;
        for (size_t i = 0; i < blocks.size(); ++i) {
            Index seen_cols = 0;
            for (size_t j = 0; j < blocks[i].size(); ++j) {
                if (j > 0) {
                    if (blocks[i][j].rows() != blocks[i][j - 1].rows()) {
                        throw std::runtime_error("blocks is not a block matrix\n");
                    }
                }
                for (Index col = 0; col < blocks[i][j].outerSize(); ++col) {
                    for (Matrix::InnerIterator it(blocks[i][j], col); it; ++it) {
                        triplets.emplace_back(seen_rows + it.row(), seen_cols + col, it.value());
                    }
                }
                seen_cols += blocks[i][j].cols();
            }
            if (seen_cols != cnt_cols) {
                throw std::runtime_error("blocks is not a block matrix\n");
            }
            seen_rows += blocks[i][0].rows();
        }
        if (seen_rows != cnt_rows) {
            throw std::runtime_error("blocks is not a block matrix\n");
        }
        res.setFromTriplets(triplets.begin(), triplets.end());
        return res;
    }

    Matrix construct_diag(const Vector &vec) {
        Matrix res(vec.rows(), vec.rows());
        std::vector<Eigen::Triplet<double>> triplets;
        for (Index i = 0; i < vec.rows(); ++i) {
            if (vec(i) != 0) {
                triplets.emplace_back(i, i, vec(i));
            }
        }
        res.setFromTriplets(triplets.begin(), triplets.end());
        return res;
    }

    std::vector<Eigen::Triplet<double>> to_triplets(const Matrix &m) {
        std::vector<Eigen::Triplet<double>> res;
        for (Index col = 0; col < m.outerSize(); ++col) {
            for (Matrix::InnerIterator it(m, col); it; ++it) {
                res.emplace_back(it.row(), col, it.value());
            }
        }
        return res;
    }
} // namespace SimplexLP
