#ifndef SIMPLEXLP_SOLVER_HPP
#define SIMPLEXLP_SOLVER_HPP

#include <simplexlp/structs.hpp>
#include <simplexlp/engine.hpp>
#include <simplexlp/options.hpp>
#include <functional>
#include <string>

namespace SimplexLP {

    struct Result {
        Status status = Status::Optimal;
        bool success = false;
        // original space; best effort when not optimal, +inf on the unbounded column after presolve
        Vector x;
        double fun = 0;
        int nit = 0;
        std::string message;
        // basic columns in standard-form indices
        std::vector<Index> basis;
        // b_ub - A_ub x and b_eq - A_eq x; empty when the constraint is absent
        Vector slack, con;
        std::vector<std::string> warnings;
    };

    struct CallbackInfo {
        Vector x;
        DenseMatrix tableau;
        int phase;
        int nit;
        // (row, column); (-1, -1) when there is no pivot
        std::pair<Index, Index> pivot;
        std::vector<Index> basis;
        bool complete;
    };

    using Callback = std::function<void(const CallbackInfo&)>;

    std::string status_message(Status status);

    /**
     * minimize c^T x  s.t.  A_ub x <= b_ub, A_eq x == b_eq, bounds.
     *
     * Throws DimensionError / InvalidBoundsError on malformed input before any
     * work. Infeasibility, unboundedness and the iteration limit are statuses.
     */
    Result linprog(const Problem &prob, const Options &options = {}, const Callback &callback = {});

} // namespace SimplexLP

#endif // SIMPLEXLP_SOLVER_HPP
