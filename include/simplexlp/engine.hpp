#ifndef SIMPLEXLP_ENGINE_HPP
#define SIMPLEXLP_ENGINE_HPP

#include <simplexlp/tableau.hpp>
#include <functional>

namespace SimplexLP {

    enum class Status : int {
        Optimal = 0,
        IterationLimit = 1,
        Infeasible = 2,
        Unbounded = 3,
    };

    /**
     * Two-phase primal simplex over a Tableau it does not own.
     *
     * Initialized -> Iterating -> {Optimal | Infeasible | Unbounded | IterationLimit}
     *
     * Every pivot counts toward maxiter except the ones that drive leftover
     * artificials out of the basis after phase 1. The hook runs after every
     * pivot, including those.
     */
    class SimplexEngine {
      public:
        // (tableau, phase, nit, pivot row, pivot column)
        using PivotHook = std::function<void(const Tableau&, int, int, Index, Index)>;

        SimplexEngine(Tableau &tableau, int maxiter, double tol, PivotHook hook = {});

        Status run();

        int nit() const { return nit_; }

        int phase() const { return phase_; }

        // Feasibility threshold on the auxiliary objective.
        double feasibility_tol() const;

      private:
        Status iterate();

        void drive_out_artificials();

        void notify(Index row, Index col) const;

        Tableau &tableau;
        int maxiter;
        double tol;
        PivotHook hook;
        int nit_ = 0;
        int phase_ = 1;
    };

} // namespace SimplexLP

#endif // SIMPLEXLP_ENGINE_HPP
