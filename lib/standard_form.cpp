#include <simplexlp/standard_form.hpp>
#include <simplexlp/errors.hpp>
#include <simplexlp/matrices.hpp>

#include <cmath>
#include <string>

namespace SimplexLP {
    ColumnTransform ColumnTransform::identity(Index col) {
        return ColumnTransform{Kind::Identity, col, -1, 0};
    }

    ColumnTransform ColumnTransform::shift(Index col, double amount) {
        return ColumnTransform{Kind::Shift, col, -1, amount};
    }

    ColumnTransform ColumnTransform::negate(Index col, double amount) {
        return ColumnTransform{Kind::Negate, col, -1, amount};
    }

    ColumnTransform ColumnTransform::split(Index pos, Index neg) {
        return ColumnTransform{Kind::Split, pos, neg, 0};
    }

    double ColumnTransform::restore(const Vector &z) const {
        switch (kind) {
            case Kind::Identity:
                return z(col);
            case Kind::Shift:
                return z(col) + amount;
            case Kind::Negate:
                return amount - z(col);
            case Kind::Split:
                return z(col) - z(neg);
        }
        return z(col);
    }

    Vector StandardForm::restore(const Vector &z) const {
        Vector x(transforms.size());
        for (size_t j = 0; j < transforms.size(); ++j) {
            x(j) = transforms[j].restore(z);
        }
        return x;
    }

    std::vector<Bound> expand_bounds(const Problem &prob) {
        if (prob.bounds.empty()) {
            return std::vector<Bound>(prob.n, Bound(0, kInf));
        }
        if (prob.bounds.size() == 1) {
            return std::vector<Bound>(prob.n, prob.bounds[0]);
        }
        if (prob.bounds.size() != prob.n) {
            throw DimensionError("bounds must have 1 or " + std::to_string(prob.n) + " entries, got "
                                 + std::to_string(prob.bounds.size()));
        }
        return prob.bounds;
    }

    void validate(const Problem &prob) {
        Index n = prob.c.size();
        if (n == 0) {
            throw DimensionError("c must have at least one element");
        }
        if (static_cast<Index>(prob.n) != prob.c.size()) {
            throw DimensionError("problem size " + std::to_string(prob.n) + " differs from the length of c");
        }
        if (prob.has_ub()) {
            if (prob.A_ub.cols() != n) {
                throw DimensionError("A_ub must have " + std::to_string(n) + " columns, got "
                                     + std::to_string(prob.A_ub.cols()));
            }
            if (prob.b_ub.size() != prob.A_ub.rows()) {
                throw DimensionError("b_ub must have " + std::to_string(prob.A_ub.rows()) + " entries, got "
                                     + std::to_string(prob.b_ub.size()));
            }
        }
        if (prob.has_eq()) {
            if (prob.A_eq.cols() != n) {
                throw DimensionError("A_eq must have " + std::to_string(n) + " columns, got "
                                     + std::to_string(prob.A_eq.cols()));
            }
            if (prob.b_eq.size() != prob.A_eq.rows()) {
                throw DimensionError("b_eq must have " + std::to_string(prob.A_eq.rows()) + " entries, got "
                                     + std::to_string(prob.b_eq.size()));
            }
        }

        std::vector<Bound> bounds = expand_bounds(prob);
        for (size_t j = 0; j < bounds.size(); ++j) {
            auto [lower, upper] = bounds[j];
            if (std::isnan(lower) || std::isnan(upper)) {
                throw InvalidBoundsError("bound of variable " + std::to_string(j) + " is NaN");
            }
            if (lower == kInf || upper == -kInf) {
                throw InvalidBoundsError("bound of variable " + std::to_string(j) + " excludes every value");
            }
            if (lower > upper) {
                throw InvalidBoundsError("lower bound of variable " + std::to_string(j) + " exceeds its upper bound");
            }
        }
    }

    StandardForm build_standard_form(const Problem &prob) {
        validate(prob);
        debug_print("Called build_standard_form with n == {0}\n", prob.n);

        Index n = prob.n;
        Index n_ub = prob.has_ub() ? prob.A_ub.rows() : 0;
        Index n_eq = prob.has_eq() ? prob.A_eq.rows() : 0;
        Matrix A_ub = n_ub > 0 ? prob.A_ub : Matrix(0, n);
        Matrix A_eq = n_eq > 0 ? prob.A_eq : Matrix(0, n);

        std::vector<Bound> bounds = expand_bounds(prob);
        Vector sign = Vector::Ones(n);
        Vector shift = Vector::Zero(n);
        std::vector<Index> split, bounded;
        std::vector<ColumnTransform> transforms;
        std::vector<double> bound_rhs;

        for (Index j = 0; j < n; ++j) {
            auto [lower, upper] = bounds[j];
            if (std::isfinite(lower)) {
                transforms.push_back(lower == 0 ? ColumnTransform::identity(j) : ColumnTransform::shift(j, lower));
                shift(j) = lower;
                if (std::isfinite(upper)) {
                    bounded.emplace_back(j);
                    bound_rhs.emplace_back(upper - lower);
                }
            } else if (std::isfinite(upper)) {
                transforms.push_back(ColumnTransform::negate(j, upper));
                sign(j) = -1;
                shift(j) = upper;
            } else {
                transforms.push_back(ColumnTransform::split(j, n + split.size()));
                split.emplace_back(j);
            }
        }

        Index n_split = split.size();
        Index n_bound = bounded.size();

        // x = sign * z + shift for every non-split variable
        Matrix D = construct_diag(sign);
        Matrix A1_ub = A_ub * D;
        Matrix A1_eq = A_eq * D;
        Matrix neg_ub = -select_columns(A_ub, split);
        Matrix neg_eq = -select_columns(A_eq, split);
        Vector b1_ub = n_ub > 0 ? Vector(prob.b_ub - A_ub * shift) : Vector(0);
        Vector b1_eq = n_eq > 0 ? Vector(prob.b_eq - A_eq * shift) : Vector(0);

        std::vector<Eigen::Triplet<double>> bound_triplets;
        for (Index i = 0; i < n_bound; ++i) {
            bound_triplets.emplace_back(i, bounded[i], 1.0);
        }
        Matrix E(n_bound, n);
        E.setFromTriplets(bound_triplets.begin(), bound_triplets.end());

        Matrix I_ub = construct_diag(Vector::Ones(n_ub));
        Matrix I_bound = construct_diag(Vector::Ones(n_bound));

        Matrix A = construct_block({
            {A1_ub, neg_ub, I_ub, Matrix(n_ub, n_bound)},
            {A1_eq, neg_eq, Matrix(n_eq, n_ub), Matrix(n_eq, n_bound)},
            {E, Matrix(n_bound, n_split), Matrix(n_bound, n_ub), I_bound},
        });

        Vector b(n_ub + n_eq + n_bound);
        for (Index i = 0; i < n_ub; ++i) {
            b(i) = b1_ub(i);
        }
        for (Index i = 0; i < n_eq; ++i) {
            b(n_ub + i) = b1_eq(i);
        }
        for (Index i = 0; i < n_bound; ++i) {
            b(n_ub + n_eq + i) = bound_rhs[i];
        }

        // every row is normalized to a non-negative right-hand side
        Vector row_sign = Vector::Ones(b.size());
        for (Index i = 0; i < b.size(); ++i) {
            if (b(i) < 0) {
                row_sign(i) = -1;
            }
        }

        StandardForm sf;
        sf.A = construct_diag(row_sign) * A;
        sf.A.prune(0.0);
        sf.b = b.cwiseProduct(row_sign);
        sf.c = Vector::Zero(A.cols());
        for (Index j = 0; j < n; ++j) {
            sf.c(j) = sign(j) * prob.c(j);
        }
        for (Index s = 0; s < n_split; ++s) {
            sf.c(n + s) = -prob.c(split[s]);
        }
        sf.offset = prob.c.dot(shift);
        sf.transforms = transforms;
        sf.n_ub = n_ub;
        sf.n_eq = n_eq;
        sf.n_bound = n_bound;

        debug_print("standard form: {0} rows, {1} columns, {2} split, {3} bounded\n", sf.rows(), sf.cols(), n_split, n_bound);
        return sf;
    }
} // namespace SimplexLP
