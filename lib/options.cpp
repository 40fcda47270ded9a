#include <simplexlp/options.hpp>

#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>

namespace SimplexLP {
    namespace {
        bool parse_bool(const std::string &key, std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char ch) { return std::tolower(ch); });
            if (value == "true" || value == "1" || value == "yes" || value == "on") {
                return true;
            }
            if (value == "false" || value == "0" || value == "no" || value == "off") {
                return false;
            }
            throw std::invalid_argument("option " + key + " expects a boolean, got '" + value + "'");
        }

        int parse_int(const std::string &key, const std::string &value) {
            size_t pos = 0;
            int res;
            try {
                res = std::stoi(value, &pos);
            } catch (const std::exception &) {
                throw std::invalid_argument("option " + key + " expects an integer, got '" + value + "'");
            }
            if (pos != value.size() || res < 0) {
                throw std::invalid_argument("option " + key + " expects a non-negative integer, got '" + value + "'");
            }
            return res;
        }

        double parse_double(const std::string &key, const std::string &value) {
            size_t pos = 0;
            double res;
            try {
                res = std::stod(value, &pos);
            } catch (const std::exception &) {
                throw std::invalid_argument("option " + key + " expects a number, got '" + value + "'");
            }
            if (pos != value.size() || !(res > 0)) {
                throw std::invalid_argument("option " + key + " expects a positive number, got '" + value + "'");
            }
            return res;
        }
    } // namespace

    Options parse_options(const std::unordered_map<std::string, std::string> &values) {
        // sorted so that the unknown keys come out in a stable order
        std::map<std::string, std::string> sorted(values.begin(), values.end());

        Options options;
        for (const auto &[key, value] : sorted) {
            if (key == "maxiter") {
                options.maxiter = parse_int(key, value);
            } else if (key == "presolve" || key == "enable_presolve") {
                options.presolve = parse_bool(key, value);
            } else if (key == "disp") {
                options.disp = parse_bool(key, value);
            } else if (key == "sparse" || key == "use_sparse_factorization") {
                options.sparse = parse_bool(key, value);
            } else if (key == "tol" || key == "tolerance") {
                options.tol = parse_double(key, value);
            } else {
                options.unknown.push_back(key);
            }
        }
        return options;
    }
} // namespace SimplexLP
