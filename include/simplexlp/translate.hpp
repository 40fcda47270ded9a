#ifndef SIMPLEXLP_TRANSLATE_HPP
#define SIMPLEXLP_TRANSLATE_HPP

#include <simplexlp/presolve.hpp>
#include <simplexlp/solver.hpp>
#include <simplexlp/standard_form.hpp>

namespace SimplexLP {

    /**
     * Maps values of the reduced (presolved) standard form back to the
     * caller's variables. Holds references; the problem, standard form and
     * presolve result must outlive it.
     */
    class ResultTranslator {
      public:
        ResultTranslator(const Problem &prob, const StandardForm &sf, const PresolveResult &pre);

        // Standard-form vector: kept columns from z_reduced, removed ones from the presolve fixes.
        Vector expand(const Vector &z_reduced) const;

        Vector to_original(const Vector &z_reduced) const;

        // Tableau column indices to standard-form ones; artificials follow the standard-form columns.
        std::vector<Index> to_standard_basis(const std::vector<Index> &basis, Index structural) const;

        // Sets x, fun, slack and con.
        void fill(Result &res, const Vector &z_reduced) const;

      private:
        const Problem &prob;
        const StandardForm &sf;
        const PresolveResult &pre;
    };

    // c . x, skipping zero costs so that an infinite x entry does not give NaN.
    double objective(const Vector &c, const Vector &x);

} // namespace SimplexLP

#endif // SIMPLEXLP_TRANSLATE_HPP
