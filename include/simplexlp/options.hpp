#ifndef SIMPLEXLP_OPTIONS_HPP
#define SIMPLEXLP_OPTIONS_HPP

#include <string>
#include <unordered_map>
#include <vector>

namespace SimplexLP {

    struct Options {
        // pivot cap across both phases
        int maxiter = 1000;
        bool presolve = true;
        // print progress and the final message to stdout
        bool disp = false;
        // sparse LU in basis refinement
        bool sparse = false;
        double tol = 1e-9;
        // keys parse_options did not recognize
        std::vector<std::string> unknown;
    };

    /**
     * Reads maxiter, presolve (enable_presolve), disp, sparse
     * (use_sparse_factorization) and tol (tolerance) from a string map.
     * Booleans accept true/false/1/0/yes/no/on/off.
     * Throws std::invalid_argument on an unparsable value of a known key.
     */
    Options parse_options(const std::unordered_map<std::string, std::string> &values);

} // namespace SimplexLP

#endif // SIMPLEXLP_OPTIONS_HPP
