#include <simplexlp/io.hpp>

#include <cmath>
#include <iomanip>
#include <stdexcept>
#include <string>

namespace SimplexLP {
    namespace {
        std::string next_token(std::istream &in, const char *what) {
            std::string token;
            if (!(in >> token)) {
                throw std::runtime_error(std::string("unexpected end of input while reading ") + what + "\n");
            }
            return token;
        }

        double read_double(std::istream &in, const char *what) {
            std::string token = next_token(in, what);
            size_t pos = 0;
            double res;
            try {
                res = std::stod(token, &pos);
            } catch (const std::exception &) {
                throw std::runtime_error("bad number '" + token + "' in " + what + "\n");
            }
            if (pos != token.size()) {
                throw std::runtime_error("bad number '" + token + "' in " + what + "\n");
            }
            return res;
        }

        long long read_count(std::istream &in, const char *what) {
            double value = read_double(in, what);
            if (value < 0 || value != std::floor(value)) {
                throw std::runtime_error(std::string("bad count in ") + what + "\n");
            }
            return static_cast<long long>(value);
        }

        Matrix read_triplets(std::istream &in, Index rows, Index cols, long long nnz, const char *what) {
            std::vector<Eigen::Triplet<double>> data;
            for (long long t = 0; t < nnz; ++t) {
                long long i = read_count(in, what);
                long long j = read_count(in, what);
                double val = read_double(in, what);
                if (i >= rows || j >= cols) {
                    throw std::runtime_error(std::string("entry out of range in ") + what + "\n");
                }
                if (val != 0) {
                    data.emplace_back(i, j, val);
                }
            }
            Matrix A(rows, cols);
            A.setFromTriplets(data.begin(), data.end());
            return A;
        }

        Vector read_vector(std::istream &in, Index size, const char *what) {
            Vector v(size);
            for (Index i = 0; i < size; ++i) {
                v(i) = read_double(in, what);
            }
            return v;
        }

        void write_vector(std::ostream &out, const Vector &v) {
            for (Index i = 0; i < v.size(); ++i) {
                out << v(i) << " \n"[i == v.size() - 1];
            }
        }

        void write_triplets(std::ostream &out, const Matrix &A) {
            for (Index col = 0; col < A.outerSize(); ++col) {
                for (Matrix::InnerIterator it(A, col); it; ++it) {
                    out << it.row() << ' ' << col << ' ' << it.value() << '\n';
                }
            }
        }
    } // namespace

    Problem read_problem(std::istream &in) {
        Index n = read_count(in, "header");
        Index m_ub = read_count(in, "header");
        Index m_eq = read_count(in, "header");
        long long nnz_ub = read_count(in, "header");
        long long nnz_eq = read_count(in, "header");
        long long n_bounds = read_count(in, "header");
        debug_print("read_problem: n == {0}, m_ub == {1}, m_eq == {2}\n", n, m_ub, m_eq);

        Matrix A_ub = read_triplets(in, m_ub, n, nnz_ub, "A_ub");
        Matrix A_eq = read_triplets(in, m_eq, n, nnz_eq, "A_eq");
        Vector c = read_vector(in, n, "c");
        Vector b_ub = read_vector(in, m_ub, "b_ub");
        Vector b_eq = read_vector(in, m_eq, "b_eq");

        Problem prob(c);
        if (m_ub > 0) {
            prob.with_ub(A_ub, b_ub);
        }
        if (m_eq > 0) {
            prob.with_eq(A_eq, b_eq);
        }
        std::vector<Bound> bounds;
        for (long long i = 0; i < n_bounds; ++i) {
            double lower = read_double(in, "bounds");
            double upper = read_double(in, "bounds");
            bounds.emplace_back(lower, upper);
        }
        prob.with_bounds(bounds);
        return prob;
    }

    void write_problem(std::ostream &out, const Problem &prob) {
        Index m_ub = prob.has_ub() ? prob.A_ub.rows() : 0;
        Index m_eq = prob.has_eq() ? prob.A_eq.rows() : 0;
        out << prob.n << ' ' << m_ub << ' ' << m_eq << ' '
            << (m_ub > 0 ? prob.A_ub.nonZeros() : 0) << ' '
            << (m_eq > 0 ? prob.A_eq.nonZeros() : 0) << ' '
            << prob.bounds.size() << '\n';

        out << std::setprecision(17);
        if (m_ub > 0) {
            write_triplets(out, prob.A_ub);
        }
        if (m_eq > 0) {
            write_triplets(out, prob.A_eq);
        }
        write_vector(out, prob.c);
        if (m_ub > 0) {
            write_vector(out, prob.b_ub);
        }
        if (m_eq > 0) {
            write_vector(out, prob.b_eq);
        }
        for (auto [lower, upper] : prob.bounds) {
            out << lower << ' ' << upper << '\n';
        }
    }
} // namespace SimplexLP
