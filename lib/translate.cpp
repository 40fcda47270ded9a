#include <simplexlp/translate.hpp>

namespace SimplexLP {
    ResultTranslator::ResultTranslator(const Problem &prob_, const StandardForm &sf_, const PresolveResult &pre_)
        : prob(prob_)
        , sf(sf_)
        , pre(pre_)
        {}

    Vector ResultTranslator::expand(const Vector &z_reduced) const {
        Vector z = pre.fixed;
        for (size_t j = 0; j < pre.cols.size() && static_cast<Index>(j) < z_reduced.size(); ++j) {
            z(pre.cols[j]) = z_reduced(j);
        }
        return z;
    }

    Vector ResultTranslator::to_original(const Vector &z_reduced) const {
        return sf.restore(expand(z_reduced));
    }

    std::vector<Index> ResultTranslator::to_standard_basis(const std::vector<Index> &basis, Index structural) const {
        std::vector<Index> res;
        res.reserve(basis.size());
        for (Index col : basis) {
            if (col < structural) {
                res.emplace_back(pre.cols[col]);
            } else {
                res.emplace_back(sf.cols() + (col - structural));
            }
        }
        return res;
    }

    void ResultTranslator::fill(Result &res, const Vector &z_reduced) const {
        res.x = to_original(z_reduced);
        res.fun = objective(prob.c, res.x);
        if (prob.has_ub()) {
            res.slack = prob.b_ub - prob.A_ub * res.x;
        } else {
            res.slack = Vector(0);
        }
        if (prob.has_eq()) {
            res.con = prob.b_eq - prob.A_eq * res.x;
        } else {
            res.con = Vector(0);
        }
    }

    double objective(const Vector &c, const Vector &x) {
        double res = 0;
        for (Index j = 0; j < c.size(); ++j) {
            if (c(j) != 0) {
                res += c(j) * x(j);
            }
        }
        return res;
    }
} // namespace SimplexLP
