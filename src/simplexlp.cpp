#include <simplexlp/io.hpp>
#include <simplexlp/solver.hpp>
#include <iostream>
#include <string>
#include <unordered_map>

int main(int argc, char *argv[]) {
    std::unordered_map<std::string, std::string> values;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            std::cerr << "Usage: " << argv[0] << " [key=value ...] < problem\n";
            return 1;
        }
        values[arg.substr(0, eq)] = arg.substr(eq + 1);
    }

    try {
        SimplexLP::Options options = SimplexLP::parse_options(values);
        SimplexLP::Problem prob = SimplexLP::read_problem(std::cin);
        SimplexLP::Result res = SimplexLP::linprog(prob, options);

        for (const auto &warning : res.warnings) {
            std::cerr << "warning: " << warning << '\n';
        }

        std::cout.precision(12);
        std::cout << "status: " << static_cast<int>(res.status) << '\n';
        std::cout << "message: " << res.message << '\n';
        std::cout << "nit: " << res.nit << '\n';
        std::cout << "fun: " << res.fun << '\n';
        std::cout << "x = (";
        for (SimplexLP::Index i = 0; i < res.x.size(); ++i) {
            std::cout << res.x(i);
            if (i < res.x.size() - 1) std::cout << ", ";
        }
        std::cout << ")\n";
        return res.success ? 0 : 2;
    } catch (const std::exception &e) {
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    }
}
