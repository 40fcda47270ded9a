#include <simplexlp/engine.hpp>

#include <cmath>

namespace SimplexLP {
    SimplexEngine::SimplexEngine(Tableau &tableau_, int maxiter_, double tol_, PivotHook hook_)
        : tableau(tableau_)
        , maxiter(maxiter_)
        , tol(tol_)
        , hook(std::move(hook_))
        {}

    double SimplexEngine::feasibility_tol() const {
        return tol * (1 + tableau.rhs_norm());
    }

    Status SimplexEngine::run() {
        debug_print("Called SimplexEngine::run with m == {0}, k == {1}, maxiter == {2}\n",
                    tableau.rows(), tableau.structural(), maxiter);
        phase_ = 1;
        Status status = iterate();
        if (status == Status::IterationLimit) {
            return status;
        }
        debug_print("phase 1 finished after {0} pivots, infeasibility == {1}\n", nit_, tableau.infeasibility());
        if (tableau.infeasibility() > feasibility_tol()) {
            return Status::Infeasible;
        }

        drive_out_artificials();
        tableau.end_phase_one();

        phase_ = 2;
        status = iterate();
        debug_print("phase 2 finished after {0} pivots\n", nit_);
        return status;
    }

    Status SimplexEngine::iterate() {
        while (true) {
            PivotDecision decision = tableau.select_pivot(tol);
            if (decision.kind == PivotDecision::Kind::Optimal) {
                return Status::Optimal;
            }
            if (decision.kind == PivotDecision::Kind::Unbounded) {
                // the auxiliary objective is bounded below by 0; the feasibility check decides
                return phase_ == 1 ? Status::Optimal : Status::Unbounded;
            }
            if (nit_ >= maxiter) {
                return Status::IterationLimit;
            }
            tableau.pivot(decision.row, decision.col);
            ++nit_;
            debug_print("phase {0}, pivot {1}: row {2}, col {3}\n", phase_, nit_, decision.row, decision.col);
            notify(decision.row, decision.col);
        }
    }

    void SimplexEngine::drive_out_artificials() {
        const DenseMatrix &T = tableau.matrix();
        Index row = 0;
        while (row < tableau.rows()) {
            if (!tableau.is_artificial(tableau.basis()[row])) {
                ++row;
                continue;
            }
            Index col = -1;
            double best = tol;
            for (Index j = 0; j < tableau.structural(); ++j) {
                if (std::abs(T(row, j)) > best) {
                    best = std::abs(T(row, j));
                    col = j;
                }
            }
            if (col == -1) {
                debug_print("row {0} is redundant\n", row);
                tableau.drop_row(row);
                continue;
            }
            tableau.pivot(row, col);
            notify(row, col);
            ++row;
        }
    }

    void SimplexEngine::notify(Index row, Index col) const {
        if (hook) {
            hook(tableau, phase_, nit_, row, col);
        }
    }
} // namespace SimplexLP
