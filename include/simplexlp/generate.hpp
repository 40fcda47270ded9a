#ifndef SIMPLEXLP_GENERATE_HPP
#define SIMPLEXLP_GENERATE_HPP

#include <simplexlp/structs.hpp>

namespace SimplexLP {

    /**
     * min c^T x, A x = b, x >= 0 with a known feasible x and a dual feasible y,
     * so the optimum exists. A is m x n (n > m) with about max_non_zero entries.
     */
    Problem generate_feasible_problem(int m, int n, long long max_non_zero, int random_seed);

    /**
     * Transportation problem: every source ships at most its supply, every sink
     * receives exactly its demand, total supply covers total demand. Variable
     * i * sinks + j is the amount shipped from source i to sink j.
     */
    Problem generate_transport_problem(int sources, int sinks, int random_seed);

    /**
     * LP relaxation of the n x n magic square. Variable k * n^2 + cell is 1 when
     * cell holds the number k + 1. Costs are uniform in [0, 1).
     */
    Problem magic_square(int n, int random_seed);

} // namespace SimplexLP

#endif // SIMPLEXLP_GENERATE_HPP
