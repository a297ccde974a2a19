#include "formats/matroid_file.hpp"
#include "matroids/matroid_factory.hpp"
#include "catalog/catalog.hpp"
#include "common.hpp"
#include <boost/program_options.hpp>
#include <iostream>
#include <iomanip>
#include <filesystem>

namespace po = boost::program_options;
using namespace matroidcore;

// A matroid operand: a .mat path, or "catalog:<name>"
std::unique_ptr<Matroid> load_operand(const std::string& operand) {
    const std::string prefix = "catalog:";
    if (operand.rfind(prefix, 0) == 0) {
        return catalog::named_matroid(operand.substr(prefix.size()));
    }
    return make_matroid(load_matroid(operand));
}

int main(int argc, char** argv) {
    // Start performance tracking
    Timer timer;
    timer.start();

    // Helper to print performance info to stderr
    auto print_performance = [&timer]() {
        timer.stop();
        double runtime = timer.elapsed_seconds();
        double memory_mb = get_peak_memory_mb();
        std::cerr << "[Performance] Runtime: " << std::fixed << std::setprecision(2) << runtime << "s";
        if (memory_mb > 0.0) {
            std::cerr << " | Peak Memory: " << std::fixed << std::setprecision(1) << memory_mb << " MB";
        }
        std::cerr << "\n";
    };

    try {
        std::string first;
        std::string second;
        bool quiet = false;

        po::options_description desc("Test two matroids for isomorphism");
        desc.add_options()
            ("help,h", "Show help message")
            ("first,a", po::value<std::string>(&first)->required(), "First matroid (.mat file or catalog:<name>)")
            ("second,b", po::value<std::string>(&second)->required(), "Second matroid (.mat file or catalog:<name>)")
            ("quiet,q", po::bool_switch(&quiet), "Only report through the exit code");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "matroid_iso - Test two matroids for isomorphism\n\n";
            std::cout << desc << "\n";
            std::cout << "DESCRIPTION:\n";
            std::cout << "  Searches for a bijection between the ground sets that maps the defining\n";
            std::cout << "  sets of the first matroid onto those of the second. Matroids given in\n";
            std::cout << "  different encodings are compared through their circuits.\n\n";
            std::cout << "EXIT STATUS:\n";
            std::cout << "  0 isomorphic, " << static_cast<int>(ErrorCode::NOT_ISOMORPHIC)
                      << " not isomorphic, 1 on error\n\n";
            std::cout << "EXAMPLES:\n";
            std::cout << "  matroid_iso -a catalog:theta3 -b catalog:k4\n";
            std::cout << "  matroid_iso -a fano.mat -b fano_lattice.mat\n";
            print_performance();
            return 0;
        }

        po::notify(vm);

        auto M = load_operand(first);
        auto N = load_operand(second);

        auto phi = M->isomorphism(*N);
        if (!quiet) {
            if (phi) {
                std::cout << "Isomorphic\n";
                for (const auto& [from, to] : *phi) {
                    std::cout << "  " << from << " -> " << to << "\n";
                }
            } else {
                std::cout << "Not isomorphic\n";
            }
        }

        print_performance();
        return phi ? 0 : static_cast<int>(ErrorCode::NOT_ISOMORPHIC);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_performance();
        return 1;
    }
}
