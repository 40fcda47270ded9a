#include <simplexlp/generate.hpp>
#include <simplexlp/io.hpp>
#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
    std::string kind = argc > 1 ? argv[1] : "";

    SimplexLP::Problem prob(SimplexLP::Vector(0));
    try {
        if (kind == "feasible" && argc == 6) {
            int m = atoi(argv[2]);
            int n = atoi(argv[3]);
            long long max_non_zero = atoll(argv[4]);
            int random_seed = atoi(argv[5]);
            prob = SimplexLP::generate_feasible_problem(m, n, max_non_zero, random_seed);
        } else if (kind == "transport" && argc == 5) {
            prob = SimplexLP::generate_transport_problem(atoi(argv[2]), atoi(argv[3]), atoi(argv[4]));
        } else if (kind == "magic" && argc == 4) {
            prob = SimplexLP::magic_square(atoi(argv[2]), atoi(argv[3]));
        } else {
            std::cerr << "Usage: " << argv[0] << " feasible m n max_non_zero random_seed\n"
                      << "       " << argv[0] << " transport sources sinks random_seed\n"
                      << "       " << argv[0] << " magic n random_seed\n";
            return 1;
        }
    } catch (const std::exception &e) {
        std::cerr << "error: " << e.what() << '\n';
        return 1;
    }

    SimplexLP::write_problem(std::cout, prob);
    return 0;
}
