#include "formats/matroid_file.hpp"
#include "matroids/matroid_factory.hpp"
#include "matroids/lattice_of_flats_matroid.hpp"
#include "common.hpp"
#include <boost/program_options.hpp>
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace po = boost::program_options;
using namespace matroidcore;

// Join numbers as "a, b, c"
template <typename T>
std::string join_numbers(const std::vector<T>& values) {
    std::stringstream ss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i != 0) {
            ss << ", ";
        }
        ss << values[i];
    }
    return ss.str();
}

// Print statistics in standard format
void print_standard(const Matroid& M, const std::filesystem::path& input_file, bool valid, bool verbose) {
    std::cout << "========================================\n";
    std::cout << "Matroid Statistics\n";
    std::cout << "========================================\n";
    std::cout << "File: " << input_file.filename().string() << "\n";
    if (!M.name().empty()) {
        std::cout << "Name: " << M.name() << "\n";
    }
    std::cout << "Encoding: " << encoding_name(M.encoding()) << "\n";
    std::cout << "\n";

    std::cout << "Structure:\n";
    std::cout << "  Ground set size:              " << std::setw(12) << M.size() << "\n";
    std::cout << "  Rank:                         " << std::setw(12) << M.full_rank() << "\n";
    std::cout << "  Defining sets:                " << std::setw(12) << M.defining_sets().size() << "\n";
    std::cout << "  Valid:                        " << std::setw(12) << (valid ? "yes" : "no") << "\n";
    std::cout << "\n";

    if (valid) {
        auto girth = M.girth();
        auto whitney2 = M.whitney_numbers2();

        std::cout << "Invariants:\n";
        std::cout << "  Loops:                        " << std::setw(12) << M.loops().size() << "\n";
        std::cout << "  Girth:                        " << std::setw(12)
                  << (girth ? std::to_string(*girth) : std::string("none")) << "\n";
        std::cout << "  Paving:                       " << std::setw(12) << (M.is_paving() ? "yes" : "no") << "\n";
        std::cout << "  Flats per rank:               " << join_numbers(whitney2) << "\n";
        if (const auto* lattice = dynamic_cast<const LatticeOfFlatsMatroid*>(&M)) {
            std::cout << "  Whitney numbers (1st kind):   " << join_numbers(lattice->whitney_numbers()) << "\n";
        }
        std::cout << "\n";
    }

    if (verbose) {
        std::cout << "Defining sets:\n";
        for (const auto& s : M.defining_sets().to_element_sets()) {
            std::cout << "  " << format_set(s) << "\n";
        }
        std::cout << "\n";
    }

    std::cout << "========================================\n";
}

// Print statistics in JSON format
void print_json(const Matroid& M, const std::filesystem::path& input_file, bool valid) {
    std::cout << "{\n";
    std::cout << "  \"file\": \"" << input_file.string() << "\",\n";
    std::cout << "  \"name\": \"" << M.name() << "\",\n";
    std::cout << "  \"encoding\": \"" << encoding_name(M.encoding()) << "\",\n";
    std::cout << "  \"groundset_size\": " << M.size() << ",\n";
    std::cout << "  \"rank\": " << M.full_rank() << ",\n";
    std::cout << "  \"defining_sets\": " << M.defining_sets().size() << ",\n";
    std::cout << "  \"valid\": " << (valid ? "true" : "false");
    if (valid) {
        auto girth = M.girth();
        std::cout << ",\n";
        std::cout << "  \"loops\": " << M.loops().size() << ",\n";
        std::cout << "  \"girth\": " << (girth ? std::to_string(*girth) : std::string("null")) << ",\n";
        std::cout << "  \"paving\": " << (M.is_paving() ? "true" : "false") << ",\n";
        std::cout << "  \"flats_per_rank\": [" << join_numbers(M.whitney_numbers2()) << "]\n";
    } else {
        std::cout << "\n";
    }
    std::cout << "}\n";
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
        std::filesystem::path input_file;
        size_t num_threads = 1;
        bool json_output = false;
        bool verbose = false;

        po::options_description desc("Display statistics for a matroid file");
        desc.add_options()
            ("help,h", "Show help message")
            ("input,i", po::value<std::filesystem::path>(&input_file)->required(), "Input matroid file (.mat)")
            ("threads,t", po::value<size_t>(&num_threads)->default_value(1), "Threads for axiom validation")
            ("json,j", po::bool_switch(&json_output), "Output in JSON format")
            ("verbose,v", po::bool_switch(&verbose), "List the defining sets");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "matroid_stats - Display matroid statistics\n\n";
            std::cout << desc << "\n";
            std::cout << "Examples:\n";
            std::cout << "  # Validate a matroid and show its invariants:\n";
            std::cout << "  matroid_stats -i fano.mat\n\n";
            std::cout << "  # Validate with 8 threads, JSON output:\n";
            std::cout << "  matroid_stats -i big.mat -t 8 --json\n\n";
            std::cout << "Invariants are only reported for data that passes the axiom check.\n";
            print_performance();
            return 0;
        }

        po::notify(vm);

        if (!std::filesystem::exists(input_file)) {
            std::cerr << "Error: Input file '" << input_file << "' not found\n";
            print_performance();
            return static_cast<int>(ErrorCode::FILE_NOT_FOUND);
        }

        auto M = make_matroid(load_matroid(input_file));
        bool valid = M->is_valid(num_threads);

        if (json_output) {
            print_json(*M, input_file, valid);
        } else {
            print_standard(*M, input_file, valid, verbose);
        }

        print_performance();
        return valid ? 0 : static_cast<int>(ErrorCode::INVALID_MATROID);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_performance();
        return 1;
    }
}
