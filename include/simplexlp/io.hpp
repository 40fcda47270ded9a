#ifndef SIMPLEXLP_IO_HPP
#define SIMPLEXLP_IO_HPP

#include <simplexlp/structs.hpp>
#include <istream>
#include <ostream>

namespace SimplexLP {

    /**
     * Plain text problem format, whitespace separated:
     *
     *   n m_ub m_eq nnz_ub nnz_eq n_bounds
     *   nnz_ub lines "row col value" of A_ub
     *   nnz_eq lines "row col value" of A_eq
     *   c (n values)
     *   b_ub (m_ub values)
     *   b_eq (m_eq values)
     *   n_bounds lines "lower upper" (inf / -inf allowed)
     *
     * read_problem throws std::runtime_error on malformed input.
     */
    Problem read_problem(std::istream &in);

    void write_problem(std::ostream &out, const Problem &prob);

} // namespace SimplexLP

#endif // SIMPLEXLP_IO_HPP
