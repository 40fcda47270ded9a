#include <simplexlp/tableau.hpp>

#include <cmath>
#include <stdexcept>

namespace SimplexLP {
    Tableau::Tableau(const Matrix &A, const Vector &b, const Vector &c)
        : m(A.rows())
        , k(A.cols())
        , n_art(A.rows())
        , aux_row(true)
        , b_norm(b.size() > 0 ? b.cwiseAbs().maxCoeff() : 0.0)
        {
        if (b.size() != m || c.size() != k) {
            throw std::runtime_error("tableau dimensions do not match\n");
        }
        debug_print("Called Tableau with m == {0}, k == {1}\n", m, k);

        T = DenseMatrix::Zero(m + 2, k + n_art + 1);
        for (Index col = 0; col < A.outerSize(); ++col) {
            for (Matrix::InnerIterator it(A, col); it; ++it) {
                T(it.row(), col) = it.value();
            }
        }
        for (Index i = 0; i < m; ++i) {
            T(i, k + i) = 1;
            T(i, rhs()) = b(i);
            if (b(i) < 0) {
                T.row(i).head(k) *= -1;
                T(i, rhs()) *= -1;
            }
        }
        T.row(m).head(k) = c.transpose();

        // reduced costs of the auxiliary objective with every artificial basic
        for (Index i = 0; i < m; ++i) {
            T.row(m + 1).head(k) -= T.row(i).head(k);
            T(m + 1, rhs()) -= T(i, rhs());
        }

        basis_.resize(m);
        for (Index i = 0; i < m; ++i) {
            basis_[i] = k + i;
        }
    }

    PivotDecision Tableau::select_pivot(double tol) const {
        Index obj = objective_row();
        Index col = -1;
        double best = -tol;
        for (Index j = 0; j < k; ++j) {
            if (T(obj, j) < best) {
                best = T(obj, j);
                col = j;
            }
        }
        if (col == -1) {
            return PivotDecision{PivotDecision::Kind::Optimal};
        }

        Index row = -1;
        double ratio = kInf;
        for (Index i = 0; i < m; ++i) {
            if (T(i, col) > tol) {
                double cur = T(i, rhs()) / T(i, col);
                if (cur < ratio) {
                    ratio = cur;
                    row = i;
                }
            }
        }
        if (row == -1) {
            return PivotDecision{PivotDecision::Kind::Unbounded, -1, col};
        }
        return PivotDecision{PivotDecision::Kind::Pivot, row, col};
    }

    void Tableau::pivot(Index row, Index col) {
        double value = T(row, col);
        if (value == 0) {
            throw std::runtime_error("pivot element is zero\n");
        }
        T.row(row) /= value;
        Eigen::RowVectorXd pivot_row = T.row(row);
        for (Index i = 0; i < T.rows(); ++i) {
            if (i == row) {
                continue;
            }
            double factor = T(i, col);
            if (factor != 0) {
                T.row(i) -= factor * pivot_row;
                T(i, col) = 0;
            }
        }
        basis_[row] = col;
    }

    void Tableau::drop_row(Index row) {
        DenseMatrix nw(T.rows() - 1, T.cols());
        nw.topRows(row) = T.topRows(row);
        nw.bottomRows(T.rows() - row - 1) = T.bottomRows(T.rows() - row - 1);
        T = std::move(nw);
        basis_.erase(basis_.begin() + row);
        --m;
    }

    void Tableau::end_phase_one() {
        for (Index i = 0; i < m; ++i) {
            if (is_artificial(basis_[i])) {
                throw std::runtime_error("artificial variable left in the basis\n");
            }
        }
        DenseMatrix nw(m + 1, k + 1);
        nw.leftCols(k) = T.topLeftCorner(m + 1, k);
        nw.col(k) = T.col(rhs()).head(m + 1);
        T = std::move(nw);
        n_art = 0;
        aux_row = false;
    }

    Vector Tableau::basic_solution() const {
        Vector z = Vector::Zero(k);
        for (Index i = 0; i < m; ++i) {
            if (basis_[i] < k) {
                z(basis_[i]) = T(i, rhs());
            }
        }
        return z;
    }

    double Tableau::objective_value() const {
        return -T(m, rhs());
    }

    double Tableau::infeasibility() const {
        return aux_row ? -T(m + 1, rhs()) : 0.0;
    }
} // namespace SimplexLP
