#ifndef SIMPLEXLP_TABLEAU_HPP
#define SIMPLEXLP_TABLEAU_HPP

#include <simplexlp/structs.hpp>

namespace SimplexLP {

    struct PivotDecision {
        enum class Kind { Pivot, Optimal, Unbounded };

        Kind kind;
        Index row = -1;
        Index col = -1;
    };

    /**
     * Dense simplex tableau.
     *
     * Rows: m constraint rows, the objective row, and during phase 1 the
     * auxiliary row (sum of artificials). Columns: k structural columns, m
     * artificial columns during phase 1, and the right-hand side.
     *
     * The objective rows hold reduced costs; their right-hand-side entry holds
     * minus the current objective value. The basis columns always form an
     * identity submatrix of the constraint rows.
     */
    class Tableau {
      public:
        // Sets up the phase 1 tableau for A z = b, z >= 0 with every artificial basic.
        Tableau(const Matrix &A, const Vector &b, const Vector &c);

        Index rows() const { return m; }

        Index structural() const { return k; }

        Index artificial() const { return n_art; }

        bool in_phase_one() const { return aux_row; }

        bool is_artificial(Index col) const { return col >= k && col < k + n_art; }

        // Entering column by most negative reduced cost, leaving row by the ratio test.
        PivotDecision select_pivot(double tol) const;

        void pivot(Index row, Index col);

        void drop_row(Index row);

        // Removes the artificial columns and the auxiliary row.
        void end_phase_one();

        // Values of the structural columns; nonbasic columns are 0.
        Vector basic_solution() const;

        double objective_value() const;

        // Sum of the artificials; 0 once phase 1 has ended.
        double infeasibility() const;

        // Largest absolute right-hand side of the initial tableau.
        double rhs_norm() const { return b_norm; }

        const DenseMatrix& matrix() const { return T; }

        const std::vector<Index>& basis() const { return basis_; }

      private:
        Index rhs() const { return T.cols() - 1; }

        Index objective_row() const { return aux_row ? m + 1 : m; }

        DenseMatrix T;
        std::vector<Index> basis_;
        Index m, k, n_art;
        bool aux_row;
        double b_norm;
    };

} // namespace SimplexLP

#endif // SIMPLEXLP_TABLEAU_HPP
