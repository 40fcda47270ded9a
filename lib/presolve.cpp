#include <simplexlp/presolve.hpp>
#include <simplexlp/matrices.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>

namespace SimplexLP {
    namespace {
        void shrink(PresolveResult &res, const Matrix &A, const Vector &b, const Vector &c,
                    const std::vector<bool> &row_alive, const std::vector<bool> &col_alive) {
            for (Index i = 0; i < A.rows(); ++i) {
                if (row_alive[i]) {
                    res.rows.emplace_back(i);
                }
            }
            for (Index j = 0; j < A.cols(); ++j) {
                if (col_alive[j]) {
                    res.cols.emplace_back(j);
                }
            }
            res.A = select_rows(select_columns(A, res.cols), res.rows);
            res.b.resize(res.rows.size());
            for (size_t i = 0; i < res.rows.size(); ++i) {
                res.b(i) = b(res.rows[i]);
            }
            res.c.resize(res.cols.size());
            for (size_t j = 0; j < res.cols.size(); ++j) {
                res.c(j) = c(res.cols[j]);
            }
        }
    } // namespace

    PresolveResult identity_presolve(const Matrix &A, const Vector &b, const Vector &c) {
        PresolveResult res;
        res.A = A;
        res.b = b;
        res.c = c;
        res.rows.resize(A.rows());
        std::iota(res.rows.begin(), res.rows.end(), 0);
        res.cols.resize(A.cols());
        std::iota(res.cols.begin(), res.cols.end(), 0);
        res.fixed = Vector::Zero(A.cols());
        return res;
    }

    PresolveResult presolve(const Matrix &A, const Vector &b, const Vector &c, double tol) {
        debug_print("Called presolve on {0} x {1}\n", A.rows(), A.cols());
        Index m = A.rows();
        Index k = A.cols();

        std::vector<std::unordered_map<Index, double>> rows(m);
        std::vector<std::unordered_map<Index, double>> cols(k);
        for (const auto &triplet : to_triplets(A)) {
            if (triplet.value() != 0) {
                rows[triplet.row()][triplet.col()] = triplet.value();
                cols[triplet.col()][triplet.row()] = triplet.value();
            }
        }

        PresolveResult res;
        res.fixed = Vector::Zero(k);
        Vector rhs = b;
        std::vector<bool> row_alive(m, true);
        std::vector<bool> col_alive(k, true);

        bool changed = true;
        while (changed) {
            changed = false;

            for (Index i = 0; i < m; ++i) {
                if (!row_alive[i] || !rows[i].empty()) {
                    continue;
                }
                if (std::abs(rhs(i)) > tol) {
                    res.status = PresolveStatus::Infeasible;
                    res.message = "The problem is (trivially) infeasible because a row of A is zero "
                                  "while the corresponding entry of b is not.";
                    return res;
                }
                row_alive[i] = false;
                changed = true;
            }

            for (Index j = 0; j < k; ++j) {
                if (!col_alive[j] || !cols[j].empty()) {
                    continue;
                }
                if (c(j) < -tol) {
                    res.status = PresolveStatus::Unbounded;
                    res.fixed(j) = kInf;
                    res.message = "The problem is (trivially) unbounded because a column of A is zero "
                                  "while its cost is negative.";
                    return res;
                }
                res.fixed(j) = 0;
                col_alive[j] = false;
                changed = true;
            }

            for (Index i = 0; i < m; ++i) {
                if (!row_alive[i] || rows[i].size() != 1) {
                    continue;
                }
                auto [j, a] = *rows[i].begin();
                double value = rhs(i) / a;
                if (value < -tol) {
                    res.status = PresolveStatus::Infeasible;
                    res.message = "The problem is (trivially) infeasible because a singleton row "
                                  "forces a variable below zero.";
                    return res;
                }
                value = std::max(value, 0.0);
                res.fixed(j) = value;
                for (auto [r, coeff] : cols[j]) {
                    rhs(r) -= coeff * value;
                    rows[r].erase(j);
                }
                cols[j].clear();
                col_alive[j] = false;
                row_alive[i] = false;
                rhs(i) = 0;
                changed = true;
            }
        }

        shrink(res, A, rhs, c, row_alive, col_alive);
        debug_print("presolve kept {0} rows and {1} columns\n", res.rows.size(), res.cols.size());
        return res;
    }
} // namespace SimplexLP
