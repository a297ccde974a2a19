#include "formats/matroid_file.hpp"
#include "matroids/matroid_factory.hpp"
#include "catalog/catalog.hpp"
#include "common.hpp"
#include <boost/program_options.hpp>
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <sstream>

namespace po = boost::program_options;
using namespace matroidcore;

// Parse "a=x,b=y" into a relabelling map
ElementMap parse_relabel(const std::string& text) {
    ElementMap mapping;
    std::stringstream ss(text);
    std::string pair;
    while (std::getline(ss, pair, ',')) {
        size_t eq = pair.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == pair.size()) {
            throw std::invalid_argument("Bad relabel entry '" + pair + "', expected old=new");
        }
        std::string from = pair.substr(0, eq);
        if (mapping.count(from)) {
            throw std::invalid_argument("Element '" + from + "' relabelled twice");
        }
        mapping[from] = pair.substr(eq + 1);
    }
    return mapping;
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
        std::filesystem::path output_file;
        std::string catalog_name;
        std::string encoding_text;
        std::string relabel_text;
        size_t num_threads = 1;
        bool skip_check = false;

        po::options_description desc("Convert a matroid between encodings");
        desc.add_options()
            ("help,h", "Show help message")
            ("input,i", po::value<std::filesystem::path>(&input_file), "Input matroid file (.mat)")
            ("catalog,c", po::value<std::string>(&catalog_name), "Start from a catalog matroid instead of a file")
            ("encoding,e", po::value<std::string>(&encoding_text), "Target encoding: circuits, flats or lattice (default: keep)")
            ("relabel,r", po::value<std::string>(&relabel_text), "Rename elements, e.g. a=x,b=y")
            ("output,o", po::value<std::filesystem::path>(&output_file), "Output file (default: <input>_<encoding>.mat)")
            ("threads,t", po::value<size_t>(&num_threads)->default_value(1), "Threads for axiom validation")
            ("no-check", po::bool_switch(&skip_check), "Convert without validating the input first");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "matroid_convert - Convert a matroid between encodings\n\n";
            std::cout << desc << "\n";
            std::cout << "DESCRIPTION:\n";
            std::cout << "  Reads a matroid (or builds one from the catalog), optionally renames\n";
            std::cout << "  its elements and writes it in the requested encoding. The input is\n";
            std::cout << "  validated first, since conversion of data that violates the axioms\n";
            std::cout << "  does not describe a matroid.\n\n";
            std::cout << "CATALOG:\n";
            for (const auto& name : catalog::names()) {
                std::cout << "  " << name << "\n";
            }
            std::cout << "\n";
            std::cout << "EXAMPLES:\n";
            std::cout << "  # Circuits to lattice of flats:\n";
            std::cout << "  matroid_convert -i k4.mat -e lattice\n";
            std::cout << "  # Creates: k4_lattice.mat\n\n";
            std::cout << "  # Fano plane as flats, written to stdout:\n";
            std::cout << "  matroid_convert -c fano -e flats -o -\n\n";
            std::cout << "  # Rename elements:\n";
            std::cout << "  matroid_convert -i k4.mat -r a=x,b=y -o k4_xy.mat\n";
            print_performance();
            return 0;
        }

        po::notify(vm);

        if (vm.count("input") == vm.count("catalog")) {
            throw std::invalid_argument("Specify exactly one of --input and --catalog");
        }

        std::unique_ptr<Matroid> M;
        if (vm.count("catalog")) {
            M = catalog::named_matroid(catalog_name);
        } else {
            if (!std::filesystem::exists(input_file)) {
                std::cerr << "Error: Input file '" << input_file << "' not found\n";
                print_performance();
                return static_cast<int>(ErrorCode::FILE_NOT_FOUND);
            }
            M = make_matroid(load_matroid(input_file));
        }

        if (!skip_check && !M->is_valid(num_threads)) {
            std::cerr << "Error: Input does not satisfy the " << encoding_name(M->encoding()) << " axioms\n";
            print_performance();
            return static_cast<int>(ErrorCode::INVALID_MATROID);
        }

        Encoding target = encoding_text.empty() ? M->encoding() : parse_encoding(encoding_text);

        if (!relabel_text.empty()) {
            M = M->relabel(parse_relabel(relabel_text));
        }
        if (target != M->encoding()) {
            M = convert(*M, target);
        }

        if (output_file.empty()) {
            std::string base = vm.count("catalog") ? catalog_name : input_file.stem().string();
            output_file = base + "_" + encoding_name(target) + EXT_MATROID;
        }

        if (output_file.string() == "-") {
            write_matroid(std::cout, M->export_state());
        } else {
            save_matroid(output_file, M->export_state());
            std::cout << "Wrote " << encoding_name(target) << " encoding of size " << M->size()
                      << " and rank " << M->full_rank() << " to " << output_file << "\n";
        }

        print_performance();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_performance();
        return 1;
    }
}
