#include <simplexlp/presolve.hpp>
#include <gtest/gtest.h>

using namespace SimplexLP;

TEST(PresolveTest, ZeroRowWithNonZeroRhsIsInfeasible) {
    Matrix A = from_rows({{0, 0}, {1, 1}});
    PresolveResult res = presolve(A, from_list({1, 2}), from_list({1, 1}), 1e-9);
    EXPECT_EQ(res.status, PresolveStatus::Infeasible);
    EXPECT_FALSE(res.message.empty());
}

TEST(PresolveTest, ZeroRowWithZeroRhsIsDropped) {
    Matrix A = from_rows({{0, 0}, {1, 1}});
    PresolveResult res = presolve(A, from_list({0, 2}), from_list({1, 1}), 1e-9);
    ASSERT_EQ(res.status, PresolveStatus::Reduced);
    EXPECT_EQ(res.rows, std::vector<Index>({1}));
    EXPECT_EQ(res.cols, std::vector<Index>({0, 1}));
    EXPECT_EQ(res.A.rows(), 1);
    EXPECT_EQ(res.b(0), 2);
}

TEST(PresolveTest, ImprovingZeroColumnIsUnbounded) {
    Matrix A = from_rows({{1, 0}, {1, 0}});
    PresolveResult res = presolve(A, from_list({1, 1}), from_list({1, -1}), 1e-9);
    EXPECT_EQ(res.status, PresolveStatus::Unbounded);
    EXPECT_EQ(res.fixed(1), kInf);
}

TEST(PresolveTest, ZeroColumnIsFixedAtZero) {
    Matrix A = from_rows({{1, 0, 1}, {1, 0, 2}});
    PresolveResult res = presolve(A, from_list({1, 1}), from_list({1, 3, 1}), 1e-9);
    ASSERT_EQ(res.status, PresolveStatus::Reduced);
    EXPECT_EQ(res.cols, std::vector<Index>({0, 2}));
    EXPECT_EQ(res.fixed(1), 0);
    EXPECT_EQ(res.c(1), 1);
}

TEST(PresolveTest, SingletonRowsCascade) {
    // x0 = 2 turns the second row into the singleton x1 = 3
    Matrix A = from_rows({{2, 0}, {1, 1}});
    PresolveResult res = presolve(A, from_list({4, 5}), from_list({1, 1}), 1e-9);
    ASSERT_EQ(res.status, PresolveStatus::Reduced);
    EXPECT_TRUE(res.rows.empty());
    EXPECT_TRUE(res.cols.empty());
    EXPECT_DOUBLE_EQ(res.fixed(0), 2);
    EXPECT_DOUBLE_EQ(res.fixed(1), 3);
}

TEST(PresolveTest, NegativeSingletonIsInfeasible) {
    Matrix A = from_rows({{1, 0}, {1, 1}});
    PresolveResult res = presolve(A, from_list({-1, 2}), from_list({1, 1}), 1e-9);
    EXPECT_EQ(res.status, PresolveStatus::Infeasible);
}

TEST(PresolveTest, ConflictingSingletonsAreInfeasible) {
    Matrix A = from_rows({{1, 0, 0, 0}, {0, 2, 0, 0}, {1, 0, 0, 0}, {1, 1, 1, 1}});
    PresolveResult res = presolve(A, from_list({1, 2, 2, 4}), from_list({1, 1, 1, 2}), 1e-9);
    EXPECT_EQ(res.status, PresolveStatus::Infeasible);
}

TEST(PresolveTest, SecondRunChangesNothing) {
    Matrix A = from_rows({{1, 0, 0, 0, 0}, {0, 2, 0, 0, 0}, {1, 0, 0, 0, 0}, {1, 1, 1, 1, 0}, {0, 0, 1, 3, 0}});
    Vector b = from_list({1, 2, 1, 4, 5});
    Vector c = from_list({1, 1, 1, 2, 4});
    PresolveResult once = presolve(A, b, c, 1e-9);
    ASSERT_EQ(once.status, PresolveStatus::Reduced);
    ASSERT_EQ(once.rows.size(), 2u);
    ASSERT_EQ(once.cols.size(), 2u);

    PresolveResult twice = presolve(once.A, once.b, once.c, 1e-9);
    ASSERT_EQ(twice.status, PresolveStatus::Reduced);
    EXPECT_EQ(twice.rows, std::vector<Index>({0, 1}));
    EXPECT_EQ(twice.cols, std::vector<Index>({0, 1}));
    EXPECT_EQ((twice.A - once.A).norm(), 0);
    EXPECT_EQ(twice.b, once.b);
    EXPECT_EQ(twice.c, once.c);
    EXPECT_EQ(twice.fixed, Vector::Zero(2));
}

TEST(PresolveTest, IdentityPresolveKeepsEverything) {
    Matrix A = from_rows({{0, 0}, {1, 0}});
    PresolveResult res = identity_presolve(A, from_list({0, 1}), from_list({1, -1}));
    EXPECT_EQ(res.status, PresolveStatus::Reduced);
    EXPECT_EQ(res.rows, std::vector<Index>({0, 1}));
    EXPECT_EQ(res.cols, std::vector<Index>({0, 1}));
    EXPECT_EQ((res.A - A).norm(), 0);
}
