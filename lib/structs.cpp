#include <simplexlp/structs.hpp>
#include <simplexlp/errors.hpp>

#ifdef INFO
void _printVector(const Eigen::VectorXd& vec) {
    long len = vec.size();
    for (int i = 0; i < len; ++i) {
        std::cerr << vec(i) << " \n"[i == len - 1];
    }
}
#endif

namespace SimplexLP {
    Problem::Problem(const Vector &c_)
        : n(c_.size())
        , c(c_)
        , A_ub(0, 0)
        , A_eq(0, 0)
        {}

    Problem::Problem(const Vector &c_, const Matrix &A_ub_, const Vector &b_ub_,
                     const Matrix &A_eq_, const Vector &b_eq_, const std::vector<Bound> &bounds_)
        : n(c_.size())
        , c(c_)
        , A_ub(A_ub_)
        , A_eq(A_eq_)
        , b_ub(b_ub_)
        , b_eq(b_eq_)
        , bounds(bounds_)
        {}

    Problem& Problem::with_ub(const Matrix &A, const Vector &b) {
        A_ub = A;
        b_ub = b;
        return *this;
    }

    Problem& Problem::with_eq(const Matrix &A, const Vector &b) {
        A_eq = A;
        b_eq = b;
        return *this;
    }

    Problem& Problem::with_bounds(const std::vector<Bound> &bnds) {
        bounds = bnds;
        return *this;
    }

    bool Problem::has_ub() const {
        return A_ub.rows() > 0 || A_ub.cols() > 0 || b_ub.size() > 0;
    }

    bool Problem::has_eq() const {
        return A_eq.rows() > 0 || A_eq.cols() > 0 || b_eq.size() > 0;
    }

    Matrix from_rows(const std::vector<std::vector<double>> &rows, Index cols) {
        if (!rows.empty()) {
            cols = rows[0].size();
        }
        std::vector<Eigen::Triplet<double>> triplets;
        for (size_t i = 0; i < rows.size(); ++i) {
            if (static_cast<Index>(rows[i].size()) != cols) {
                throw DimensionError("matrix rows have different lengths\n");
            }
            for (Index j = 0; j < cols; ++j) {
                if (rows[i][j] != 0) {
                    triplets.emplace_back(i, j, rows[i][j]);
                }
            }
        }
        Matrix res(rows.size(), cols);
        res.setFromTriplets(triplets.begin(), triplets.end());
        return res;
    }

    Vector from_list(const std::vector<double> &values) {
        Vector res(values.size());
        for (size_t i = 0; i < values.size(); ++i) {
            res(i) = values[i];
        }
        return res;
    }
} // namespace SimplexLP
