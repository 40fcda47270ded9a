#include <simplexlp/solver.hpp>
#include <simplexlp/presolve.hpp>
#include <simplexlp/refine.hpp>
#include <simplexlp/standard_form.hpp>
#include <simplexlp/translate.hpp>

#include <iomanip>
#include <iostream>

namespace SimplexLP {
    std::string status_message(Status status) {
        switch (status) {
            case Status::Optimal:
                return "Optimization terminated successfully.";
            case Status::IterationLimit:
                return "Iteration limit reached.";
            case Status::Infeasible:
                return "Optimization failed. Unable to find a feasible starting point.";
            case Status::Unbounded:
                return "Optimization failed. The problem appears to be unbounded.";
        }
        return "Unknown status.";
    }

    namespace {
        void print_header() {
            std::cout << std::setw(5) << "Phase" << std::setw(12) << "Iteration"
                      << std::setw(8) << "Row" << std::setw(8) << "Column"
                      << std::setw(24) << "Objective" << '\n';
        }

        void print_iteration(int phase, int nit, Index row, Index col, double value) {
            std::cout << std::setw(5) << phase << std::setw(12) << nit
                      << std::setw(8) << row << std::setw(8) << col
                      << std::setw(24) << std::setprecision(12) << value << '\n';
        }

        void print_summary(const Result &res) {
            std::cout << res.message << '\n'
                      << "         Current function value: " << std::setprecision(12) << res.fun << '\n'
                      << "         Iterations: " << res.nit << '\n';
        }
    } // namespace

    Result linprog(const Problem &prob, const Options &options, const Callback &callback) {
        StandardForm sf = build_standard_form(prob);
        debug_print("Called linprog with n == {0}, maxiter == {1}, tol == {2}\n", prob.n, options.maxiter, options.tol);

        Result res;
        for (const auto &key : options.unknown) {
            res.warnings.push_back("Unknown solver option: " + key);
            debug_print("{0}\n", res.warnings.back());
        }

        PresolveResult pre = options.presolve ? presolve(sf.A, sf.b, sf.c, options.tol)
                                              : identity_presolve(sf.A, sf.b, sf.c);
        ResultTranslator translator(prob, sf, pre);

        auto finish = [&](const DenseMatrix &tableau, int phase) {
            res.success = res.status == Status::Optimal;
            if (options.disp) {
                print_summary(res);
            }
            if (callback) {
                callback(CallbackInfo{res.x, tableau, phase, res.nit, {-1, -1}, res.basis, true});
            }
        };

        if (pre.status != PresolveStatus::Reduced) {
            res.status = pre.status == PresolveStatus::Infeasible ? Status::Infeasible : Status::Unbounded;
            res.nit = 0;
            res.message = pre.message;
            translator.fill(res, Vector(0));
            finish(DenseMatrix(0, 0), 1);
            return res;
        }

        Tableau tableau(pre.A, pre.b, pre.c);
        SimplexEngine::PivotHook hook;
        if (options.disp || callback) {
            if (options.disp) {
                print_header();
            }
            hook = [&](const Tableau &t, int phase, int nit, Index row, Index col) {
                Vector x = translator.to_original(t.basic_solution());
                if (options.disp) {
                    print_iteration(phase, nit, row, col, phase == 1 ? t.infeasibility() : objective(prob.c, x));
                }
                if (callback) {
                    callback(CallbackInfo{x, t.matrix(), phase, nit, {row, col},
                                          translator.to_standard_basis(t.basis(), t.structural()), false});
                }
            };
        }

        SimplexEngine engine(tableau, options.maxiter, options.tol, hook);
        res.status = engine.run();
        res.nit = engine.nit();

        Vector z = tableau.basic_solution();
        if (res.status == Status::Optimal) {
            std::optional<Vector> refined = refine_basic_solution(pre.A, pre.b, tableau.basis(), options.sparse, options.tol);
            if (refined) {
                z = *refined;
            }
        }
        translator.fill(res, z);
        res.basis = translator.to_standard_basis(tableau.basis(), tableau.structural());
        res.message = status_message(res.status);
        debug_print("linprog finished: status {0}, nit {1}, fun {2}\n", static_cast<int>(res.status), res.nit, res.fun);

        finish(tableau.matrix(), engine.phase());
        return res;
    }
} // namespace SimplexLP
