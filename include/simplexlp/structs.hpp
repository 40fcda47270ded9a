#ifndef SIMPLEXLP_STRUCTS_HPP
#define SIMPLEXLP_STRUCTS_HPP

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <limits>
#include <utility>
#include <vector>

#ifdef INFO
#include <iostream>
#include <print>
#define debug_print(...) std::print(std::cerr, __VA_ARGS__)
void _printVector(const Eigen::VectorXd&);
#define debug_print_vector(a) debug_print("Vector {0}: ", #a); _printVector(a)
#else
#define debug_print(...)
#define debug_print_vector(a)
#endif

namespace SimplexLP {

    using Matrix = Eigen::SparseMatrix<double>;
    using Vector = Eigen::VectorXd;
    using DenseMatrix = Eigen::MatrixXd;
    using Index = Eigen::Index;

    constexpr double kInf = std::numeric_limits<double>::infinity();

    // (lower, upper); either side may be infinite
    using Bound = std::pair<double, double>;

    struct Problem {
        size_t n;
        Vector c;
        Matrix A_ub, A_eq;
        Vector b_ub, b_eq;
        // empty: (0, inf) for every variable, one entry: broadcast to all
        std::vector<Bound> bounds;

        explicit Problem(const Vector &c_);

        Problem(const Vector &c_, const Matrix &A_ub_, const Vector &b_ub_,
                const Matrix &A_eq_, const Vector &b_eq_, const std::vector<Bound> &bounds_ = {});

        Problem& with_ub(const Matrix &A, const Vector &b);

        Problem& with_eq(const Matrix &A, const Vector &b);

        Problem& with_bounds(const std::vector<Bound> &bnds);

        bool has_ub() const;

        bool has_eq() const;
    };

    /**
     * Builds a sparse matrix from a list of rows. Throws DimensionError on ragged input.
     * An empty list gives a 0 x cols matrix.
     */
    Matrix from_rows(const std::vector<std::vector<double>> &rows, Index cols = 0);

    Vector from_list(const std::vector<double> &values);

} // namespace SimplexLP

#endif // SIMPLEXLP_STRUCTS_HPP
