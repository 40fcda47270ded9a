#include <simplexlp/generate.hpp>
#include <simplexlp/structs.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

namespace SimplexLP {
    namespace {
        constexpr double kDoublePrecisionEps = 1e-9;

        double non_zero(std::uniform_real_distribution<double> &rng, std::mt19937 &rnd) {
            double cur = 0;
            while (std::abs(cur) < kDoublePrecisionEps) {
                cur = rng(rnd);
            }
            return cur;
        }
    } // namespace

    Problem generate_feasible_problem(int m, int n, long long max_non_zero, int random_seed) {
        debug_print("called generate_feasible_problem with m == {0}, n == {1}, max_non_zero == {2}, random_seed == {3}\n", m, n, max_non_zero, random_seed);
        if (m <= 0 || n <= m) {
            throw std::invalid_argument("n must be greater than m and m positive");
        }
        if (max_non_zero < m) {
            throw std::invalid_argument("max_non_zero must be >= m");
        }

        std::uniform_real_distribution<double> rng(-5, 5);
        std::mt19937 rnd(random_seed);

        std::vector<int> columns(n);
        std::iota(columns.begin(), columns.end(), 0);
        std::shuffle(columns.begin(), columns.end(), rnd);

        // every row and every column gets at least one entry
        std::vector<std::map<int, double>> matrix_sets(m);
        for (int i = 0; i < m; ++i) {
            matrix_sets[i].emplace(columns[i], non_zero(rng, rnd));
            --max_non_zero;
        }

        std::uniform_int_distribution<int> rows_distrib(0, m - 1);
        for (int i = m; i < n; ++i) {
            matrix_sets[rows_distrib(rnd)].emplace(columns[i], non_zero(rng, rnd));
            --max_non_zero;
        }

        int max_iterations = 10 * m;
        while (max_non_zero > 0 && max_iterations--) {
            int row1 = rows_distrib(rnd);
            int row2 = rows_distrib(rnd);
            if (row1 == row2) {
                continue;
            }
            double coefficient = non_zero(rng, rnd);
            long long cnt_non_zero_row_1 = matrix_sets[row1].size();
            auto nw_row_1 = matrix_sets[row1];
            for (auto [index, value] : matrix_sets[row2]) {
                nw_row_1[index] += value * coefficient;
                if (std::abs(nw_row_1[index]) < kDoublePrecisionEps) {
                    nw_row_1.erase(index);
                }
            }
            long long nw_non_zero_row_1 = nw_row_1.size();
            max_non_zero -= nw_non_zero_row_1 - cnt_non_zero_row_1;
            matrix_sets[row1] = nw_row_1;
        }

        std::vector<Eigen::Triplet<double>> triplets;
        for (int i = 0; i < m; ++i) {
            for (auto [index, val] : matrix_sets[i]) {
                triplets.emplace_back(i, index, val);
            }
        }
        Matrix A(m, n);
        A.setFromTriplets(triplets.begin(), triplets.end());

        Vector x(n);
        for (int i = 0; i < n; ++i) {
            x(i) = std::abs(rng(rnd));
        }
        Vector b = A * x;

        Vector y(m);
        for (int i = 0; i < m; ++i) {
            y(i) = non_zero(rng, rnd);
        }
        Vector s(n);
        for (int i = 0; i < n; ++i) {
            s(i) = std::abs(non_zero(rng, rnd));
        }
        Vector c = s + A.transpose() * y;

        Problem prob(c);
        prob.with_eq(A, b);
        return prob;
    }

    Problem generate_transport_problem(int sources, int sinks, int random_seed) {
        debug_print("called generate_transport_problem with sources == {0}, sinks == {1}, random_seed == {2}\n", sources, sinks, random_seed);
        if (sources <= 0 || sinks <= 0) {
            throw std::invalid_argument("sources and sinks must be positive");
        }

        std::mt19937 rnd(random_seed);
        std::uniform_int_distribution<int> amount(1, 20);
        std::uniform_int_distribution<int> cost(1, 10);

        Vector demand(sinks);
        for (int j = 0; j < sinks; ++j) {
            demand(j) = amount(rnd);
        }
        Vector supply(sources);
        for (int i = 0; i < sources; ++i) {
            supply(i) = amount(rnd);
        }
        // top up supplies until they cover the demand
        double total_demand = demand.sum();
        while (supply.sum() < total_demand) {
            supply(std::uniform_int_distribution<int>(0, sources - 1)(rnd)) += amount(rnd);
        }

        int n = sources * sinks;
        std::vector<Eigen::Triplet<double>> ub, eq;
        for (int i = 0; i < sources; ++i) {
            for (int j = 0; j < sinks; ++j) {
                ub.emplace_back(i, i * sinks + j, 1.0);
                eq.emplace_back(j, i * sinks + j, 1.0);
            }
        }
        Matrix A_ub(sources, n), A_eq(sinks, n);
        A_ub.setFromTriplets(ub.begin(), ub.end());
        A_eq.setFromTriplets(eq.begin(), eq.end());

        Vector c(n);
        for (int i = 0; i < n; ++i) {
            c(i) = cost(rnd);
        }

        Problem prob(c);
        prob.with_ub(A_ub, supply).with_eq(A_eq, demand);
        return prob;
    }

    Problem magic_square(int n, int random_seed) {
        debug_print("called magic_square with n == {0}, random_seed == {1}\n", n, random_seed);
        if (n <= 0) {
            throw std::invalid_argument("magic square size must be positive");
        }

        int cells = n * n;
        int vars = cells * cells;
        double magic = n * (cells + 1) / 2.0;
        std::vector<Eigen::Triplet<double>> triplets;
        std::vector<double> rhs;
        int row = 0;

        // every number is used once
        for (int k = 0; k < cells; ++k, ++row) {
            for (int cell = 0; cell < cells; ++cell) {
                triplets.emplace_back(row, k * cells + cell, 1.0);
            }
            rhs.push_back(1);
        }
        // every cell holds one number
        for (int cell = 0; cell < cells; ++cell, ++row) {
            for (int k = 0; k < cells; ++k) {
                triplets.emplace_back(row, k * cells + cell, 1.0);
            }
            rhs.push_back(1);
        }

        auto add_line = [&](const std::vector<int> &line) {
            for (int k = 0; k < cells; ++k) {
                for (int cell : line) {
                    triplets.emplace_back(row, k * cells + cell, k + 1.0);
                }
            }
            rhs.push_back(magic);
            ++row;
        };

        for (int r = 0; r < n; ++r) {
            std::vector<int> line;
            for (int col = 0; col < n; ++col) {
                line.push_back(r * n + col);
            }
            add_line(line);
        }
        for (int col = 0; col < n; ++col) {
            std::vector<int> line;
            for (int r = 0; r < n; ++r) {
                line.push_back(r * n + col);
            }
            add_line(line);
        }
        std::vector<int> diag, anti_diag;
        for (int i = 0; i < n; ++i) {
            diag.push_back(i * n + i);
            anti_diag.push_back(i * n + (n - 1 - i));
        }
        add_line(diag);
        add_line(anti_diag);

        Matrix A_eq(row, vars);
        A_eq.setFromTriplets(triplets.begin(), triplets.end());

        std::mt19937 rnd(random_seed);
        std::uniform_real_distribution<double> rng(0, 1);
        Vector c(vars);
        for (int i = 0; i < vars; ++i) {
            c(i) = rng(rnd);
        }

        Problem prob(c);
        prob.with_eq(A_eq, from_list(rhs));
        return prob;
    }
} // namespace SimplexLP
