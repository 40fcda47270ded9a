#include <simplexlp/refine.hpp>
#ifdef SUPER
#include <Eigen/SuperLUSupport>
#endif
#include <simplexlp/matrices.hpp>

#include <algorithm>
#include <cmath>

namespace SimplexLP {
    std::optional<Vector> refine_basic_solution(const Matrix &A, const Vector &b,
                                                const std::vector<Index> &basis, bool sparse, double tol) {
        debug_print("Called refine_basic_solution with {0} basic columns, sparse == {1}\n", basis.size(), sparse);
        std::vector<Index> columns;
        for (Index col : basis) {
            if (col < A.cols()) {
                columns.emplace_back(col);
            }
        }
        if (columns.empty() || columns.size() != basis.size()) {
            return std::nullopt;
        }

        Matrix B = select_columns(A, columns);
        Matrix N = B.transpose() * B;
        Vector rhs = B.transpose() * b;
        Vector z_B;

        if (sparse) {
            #ifdef SUPER
            Eigen::SuperLU<Eigen::SparseMatrix<double>> slu;
            #else
            Eigen::SparseLU<Eigen::SparseMatrix<double>> slu;
            #endif
            N.makeCompressed();
            slu.compute(N);
            if (slu.info() != Eigen::Success) {
                debug_print("sparse factorization failed\n");
                return std::nullopt;
            }
            z_B = slu.solve(rhs);
            if (slu.info() != Eigen::Success) {
                return std::nullopt;
            }
        } else {
            DenseMatrix dense = DenseMatrix(N);
            Eigen::FullPivLU<DenseMatrix> lu(dense);
            if (!lu.isInvertible()) {
                debug_print("dense factorization is singular\n");
                return std::nullopt;
            }
            z_B = lu.solve(rhs);
        }

        double eps = std::sqrt(tol);
        double scale = 1 + (b.size() > 0 ? b.cwiseAbs().maxCoeff() : 0.0);
        double residual = (B * z_B - b).cwiseAbs().maxCoeff();
        debug_print("refinement residual == {0}\n", residual);
        if (!(residual <= eps * scale) || z_B.minCoeff() < -eps) {
            return std::nullopt;
        }

        Vector z = Vector::Zero(A.cols());
        for (size_t i = 0; i < columns.size(); ++i) {
            z(columns[i]) = std::max(z_B(i), 0.0);
        }
        return z;
    }
} // namespace SimplexLP
