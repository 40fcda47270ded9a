#include <simplexlp/engine.hpp>
#include <simplexlp/tableau.hpp>
#include <gtest/gtest.h>

using namespace SimplexLP;

TEST(TableauTest, PhaseOneLayout) {
    Matrix A = from_rows({{1, 2}, {3, 1}});
    Tableau tableau(A, from_list({4, 6}), from_list({-1, -1}));
    const DenseMatrix &T = tableau.matrix();
    ASSERT_EQ(T.rows(), 4);
    ASSERT_EQ(T.cols(), 5);
    EXPECT_EQ(tableau.basis(), std::vector<Index>({2, 3}));
    EXPECT_TRUE(tableau.in_phase_one());
    EXPECT_TRUE(tableau.is_artificial(3));
    EXPECT_FALSE(tableau.is_artificial(1));
    // objective row holds the costs, auxiliary row minus the column sums
    EXPECT_EQ(T(2, 0), -1);
    EXPECT_EQ(T(3, 0), -4);
    EXPECT_EQ(T(3, 1), -3);
    EXPECT_EQ(tableau.infeasibility(), 10);
    EXPECT_EQ(tableau.objective_value(), 0);
}

TEST(TableauTest, NegativeRhsRowIsFlipped) {
    Matrix A = from_rows({{1, -1}});
    Tableau tableau(A, from_list({-2}), from_list({0, 0}));
    const DenseMatrix &T = tableau.matrix();
    EXPECT_EQ(T(0, 0), -1);
    EXPECT_EQ(T(0, 1), 1);
    EXPECT_EQ(T(0, 2), 1);
    EXPECT_EQ(T(0, 3), 2);
}

TEST(TableauTest, EnteringColumnTieGoesToLowestIndex) {
    Matrix A = from_rows({{1, 1}});
    Tableau tableau(A, from_list({2}), from_list({0, 0}));
    PivotDecision decision = tableau.select_pivot(1e-9);
    ASSERT_EQ(decision.kind, PivotDecision::Kind::Pivot);
    EXPECT_EQ(decision.col, 0);
    EXPECT_EQ(decision.row, 0);
}

TEST(TableauTest, RatioTieGoesToLowestRow) {
    Matrix A = from_rows({{2}, {1}});
    Tableau tableau(A, from_list({2, 1}), from_list({0}));
    PivotDecision decision = tableau.select_pivot(1e-9);
    ASSERT_EQ(decision.kind, PivotDecision::Kind::Pivot);
    EXPECT_EQ(decision.row, 0);
}

TEST(TableauTest, PivotKeepsIdentityBasis) {
    Matrix A = from_rows({{1, 2}, {3, 1}});
    Tableau tableau(A, from_list({4, 6}), from_list({-1, -1}));
    tableau.pivot(1, 0);
    const DenseMatrix &T = tableau.matrix();
    EXPECT_EQ(tableau.basis()[1], 0);
    EXPECT_DOUBLE_EQ(T(1, 0), 1);
    for (Index i = 0; i < T.rows(); ++i) {
        if (i != 1) {
            EXPECT_EQ(T(i, 0), 0);
        }
    }
    EXPECT_DOUBLE_EQ(tableau.basic_solution()(0), 2);
    EXPECT_DOUBLE_EQ(tableau.objective_value(), -2);
}

TEST(TableauTest, UnboundedColumnHasNoLeavingRow) {
    Matrix A = from_rows({{1, -1}});
    Tableau tableau(A, from_list({1}), from_list({0, -1}));
    tableau.pivot(0, 0);
    tableau.end_phase_one();
    EXPECT_FALSE(tableau.in_phase_one());
    EXPECT_EQ(tableau.matrix().rows(), 2);
    EXPECT_EQ(tableau.matrix().cols(), 3);
    PivotDecision decision = tableau.select_pivot(1e-9);
    EXPECT_EQ(decision.kind, PivotDecision::Kind::Unbounded);
    EXPECT_EQ(decision.col, 1);
}

TEST(TableauTest, EndPhaseOneRejectsBasicArtificials) {
    Matrix A = from_rows({{1, 1}});
    Tableau tableau(A, from_list({1}), from_list({1, 1}));
    EXPECT_THROW(tableau.end_phase_one(), std::runtime_error);
}

TEST(TableauTest, DropRowShrinksBasis) {
    Matrix A = from_rows({{1, 1}, {2, 2}});
    Tableau tableau(A, from_list({1, 2}), from_list({1, 1}));
    tableau.drop_row(1);
    EXPECT_EQ(tableau.rows(), 1);
    EXPECT_EQ(tableau.matrix().rows(), 3);
    EXPECT_EQ(tableau.basis(), std::vector<Index>({2}));
}

TEST(SimplexEngineTest, RedundantRowIsDropped) {
    Matrix A = from_rows({{1, 1}, {1, 1}});
    Tableau tableau(A, from_list({1, 1}), from_list({1, 1}));
    SimplexEngine engine(tableau, 1000, 1e-9);
    EXPECT_EQ(engine.run(), Status::Optimal);
    EXPECT_EQ(engine.nit(), 1);
    EXPECT_EQ(engine.phase(), 2);
    EXPECT_EQ(tableau.rows(), 1);
    EXPECT_DOUBLE_EQ(tableau.objective_value(), 1);
}

TEST(SimplexEngineTest, IterationCapStopsBeforeNextPivot) {
    // Klee-Minty in standard form
    Matrix A = from_rows({{1, 0, 0, 1, 0, 0}, {20, 1, 0, 0, 1, 0}, {200, 20, 1, 0, 0, 1}});
    Tableau tableau(A, from_list({1, 100, 10000}), from_list({-100, -10, -1, 0, 0, 0}));
    int calls = 0;
    SimplexEngine engine(tableau, 1, 1e-9, [&](const Tableau&, int phase, int nit, Index, Index) {
        ++calls;
        EXPECT_EQ(phase, 1);
        EXPECT_EQ(nit, 1);
    });
    EXPECT_EQ(engine.run(), Status::IterationLimit);
    EXPECT_EQ(engine.nit(), 1);
    EXPECT_EQ(calls, 1);
}

TEST(SimplexEngineTest, InfeasibleSystem) {
    // x0 + x1 = 1 and x0 + x1 = 2
    Matrix A = from_rows({{1, 1}, {1, 1}});
    Tableau tableau(A, from_list({1, 2}), from_list({1, 1}));
    SimplexEngine engine(tableau, 1000, 1e-9);
    EXPECT_EQ(engine.run(), Status::Infeasible);
    EXPECT_GT(tableau.infeasibility(), engine.feasibility_tol());
}
