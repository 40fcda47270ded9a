#ifndef SIMPLEXLP_STANDARD_FORM_HPP
#define SIMPLEXLP_STANDARD_FORM_HPP

#include <simplexlp/structs.hpp>

namespace SimplexLP {

    /**
     * How an original variable is recovered from the standard-form columns.
     *
     * Identity:  x = z[col]
     * Shift:     x = z[col] + amount            (finite lower bound)
     * Negate:    x = amount - z[col]            (only an upper bound)
     * Split:     x = z[col] - z[neg]            (free variable)
     */
    struct ColumnTransform {
        enum class Kind { Identity, Shift, Negate, Split };

        Kind kind;
        Index col;
        Index neg;
        double amount;

        static ColumnTransform identity(Index col);
        static ColumnTransform shift(Index col, double amount);
        static ColumnTransform negate(Index col, double amount);
        static ColumnTransform split(Index pos, Index neg);

        double restore(const Vector &z) const;
    };

    /**
     * min c^T z + offset, A z = b, z >= 0, b >= 0.
     *
     * Rows are ordered: inequality rows, equality rows, upper-bound rows.
     * Columns are ordered: one per original variable, negative halves of split
     * variables, inequality slacks, upper-bound slacks.
     */
    struct StandardForm {
        Matrix A;
        Vector b, c;
        double offset = 0;
        std::vector<ColumnTransform> transforms;
        Index n_ub = 0, n_eq = 0, n_bound = 0;

        Index rows() const { return A.rows(); }
        Index cols() const { return A.cols(); }

        Vector restore(const Vector &z) const;
    };

    // Resolves the bound list to one (lower, upper) pair per variable.
    std::vector<Bound> expand_bounds(const Problem &prob);

    // Throws DimensionError / InvalidBoundsError; never touches the problem.
    void validate(const Problem &prob);

    StandardForm build_standard_form(const Problem &prob);

} // namespace SimplexLP

#endif // SIMPLEXLP_STANDARD_FORM_HPP
