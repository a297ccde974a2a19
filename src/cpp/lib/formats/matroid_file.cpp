#include "matroid_file.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace matroidcore {

namespace {
    const std::string RESERVED = std::string() + SET_OPEN + SET_CLOSE + SET_SEPARATOR + KEY_SEPARATOR + COMMENT_MARKER;

    std::string trim(const std::string& s) {
        size_t begin = 0;
        while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
            ++begin;
        }
        size_t end = s.size();
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
            --end;
        }
        return s.substr(begin, end - begin);
    }

    std::string strip_whitespace(std::string s) {
        s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); }), s.end());
        return s;
    }

    std::runtime_error format_error(size_t line_no, const std::string& message) {
        return std::runtime_error("Line " + std::to_string(line_no) + ": " + message);
    }

    // Parse {a,b}{c}{} into a list of sets
    std::vector<ElementSet> parse_sets(const std::string& value, size_t line_no) {
        std::vector<ElementSet> sets;
        size_t pos = 0;
        while (pos < value.size()) {
            if (value[pos] != SET_OPEN) {
                throw format_error(line_no, "Expected '{' at column " + std::to_string(pos + 1));
            }
            size_t close = value.find(SET_CLOSE, pos);
            if (close == std::string::npos) {
                throw format_error(line_no, "Missing '}' for set opened at column " + std::to_string(pos + 1));
            }
            std::string body = value.substr(pos + 1, close - pos - 1);
            if (body.find(SET_OPEN) != std::string::npos) {
                throw format_error(line_no, "Nested '{' in set");
            }

            ElementSet set;
            if (!body.empty()) {
                std::stringstream ss(body);
                std::string element;
                while (std::getline(ss, element, SET_SEPARATOR)) {
                    if (element.empty()) {
                        throw format_error(line_no, "Empty element label in set");
                    }
                    set.insert(element);
                }
                if (body.back() == SET_SEPARATOR) {
                    throw format_error(line_no, "Empty element label in set");
                }
            }
            sets.push_back(std::move(set));
            pos = close + 1;
        }
        return sets;
    }

    void check_label(const Element& e) {
        if (e.empty()) {
            throw std::invalid_argument("Empty element label cannot be written");
        }
        for (char c : e) {
            if (std::isspace(static_cast<unsigned char>(c)) || RESERVED.find(c) != std::string::npos) {
                throw std::invalid_argument("Element label '" + e + "' contains a reserved character");
            }
        }
    }

    void write_set(std::ostream& os, const ElementSet& set) {
        for (const auto& e : set) {
            check_label(e);
        }
        os << format_set(set);
    }
}

MatroidState read_matroid(std::istream& is) {
    MatroidState state;
    std::optional<Encoding> encoding;
    bool has_groundset = false;

    // Defining lines seen, checked against the encoding once it is known
    bool saw_circuits = false;
    bool saw_flats = false;
    bool saw_lattice = false;

    std::string line;
    size_t line_no = 0;
    while (std::getline(is, line)) {
        ++line_no;
        size_t comment = line.find(COMMENT_MARKER);
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        size_t colon = line.find(KEY_SEPARATOR);
        if (colon == std::string::npos) {
            throw format_error(line_no, "Expected 'key: value'");
        }
        std::string key = trim(line.substr(0, colon));
        std::string raw_value = trim(line.substr(colon + 1));
        std::string value = strip_whitespace(raw_value);

        if (key == "name") {
            state.name = raw_value;
        } else if (key == "encoding") {
            try {
                encoding = parse_encoding(value);
            } catch (const InvalidInputError& e) {
                throw format_error(line_no, e.what());
            }
        } else if (key == "groundset") {
            auto sets = parse_sets(value, line_no);
            if (sets.size() != 1) {
                throw format_error(line_no, "Ground set must be given as exactly one set");
            }
            state.groundset.insert(sets.front().begin(), sets.front().end());
            has_groundset = true;
        } else if (key == "circuits") {
            auto sets = parse_sets(value, line_no);
            state.sets.insert(state.sets.end(), sets.begin(), sets.end());
            saw_circuits = true;
        } else if (key == "lattice") {
            auto sets = parse_sets(value, line_no);
            state.sets.insert(state.sets.end(), sets.begin(), sets.end());
            saw_lattice = true;
        } else if (key.rfind("flats", 0) == 0) {
            std::string rank_text = trim(key.substr(5));
            if (rank_text.empty() || !std::all_of(rank_text.begin(), rank_text.end(),
                                                   [](unsigned char c) { return std::isdigit(c); })) {
                throw format_error(line_no, "Expected 'flats <rank>', got '" + key + "'");
            }
            unsigned long long value = 0;
            try {
                value = std::stoull(rank_text);
            } catch (const std::out_of_range&) {
                value = std::numeric_limits<unsigned long long>::max();
            }
            if (value > std::numeric_limits<Rank>::max()) {
                throw format_error(line_no, "Rank " + rank_text + " is out of range");
            }
            Rank rank = static_cast<Rank>(value);
            auto sets = parse_sets(value, line_no);
            auto& level = state.ranked_sets[rank];
            level.insert(level.end(), sets.begin(), sets.end());
            saw_flats = true;
        } else {
            throw format_error(line_no, "Unknown key '" + key + "'");
        }
    }

    if (!encoding) {
        throw std::runtime_error("Missing 'encoding' entry");
    }
    if (!has_groundset) {
        throw std::runtime_error("Missing 'groundset' entry");
    }
    state.encoding = *encoding;

    bool mismatch = false;
    switch (state.encoding) {
        case Encoding::CIRCUITS:
            mismatch = saw_flats || saw_lattice;
            break;
        case Encoding::FLATS:
            mismatch = saw_circuits || saw_lattice;
            break;
        case Encoding::LATTICE_OF_FLATS:
            mismatch = saw_circuits || saw_flats;
            break;
    }
    if (mismatch) {
        throw std::runtime_error("Defining sets do not match the '" + encoding_name(state.encoding) + "' encoding");
    }
    return state;
}

MatroidState read_matroid_string(const std::string& text) {
    std::stringstream ss(text);
    return read_matroid(ss);
}

void write_matroid(std::ostream& os, const MatroidState& state) {
    os << COMMENT_MARKER << " MatroidCore " << VERSION << "\n";
    if (!state.name.empty()) {
        if (state.name.find_first_of(std::string(1, COMMENT_MARKER) + "\n\r") != std::string::npos) {
            throw std::invalid_argument("Matroid name '" + state.name + "' cannot be written");
        }
        os << "name: " << state.name << "\n";
    }
    os << "encoding: " << encoding_name(state.encoding) << "\n";
    os << "groundset: ";
    write_set(os, state.groundset);
    os << "\n";

    if (state.encoding == Encoding::FLATS) {
        for (const auto& [rank, group] : state.ranked_sets) {
            os << "flats " << rank << ": ";
            for (const auto& f : group) {
                write_set(os, f);
            }
            os << "\n";
        }
        return;
    }

    const char* key = state.encoding == Encoding::CIRCUITS ? "circuits" : "lattice";
    for (const auto& s : state.sets) {
        os << key << ": ";
        write_set(os, s);
        os << "\n";
    }
}

MatroidState load_matroid(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open matroid file: " + path.string());
    }
    return read_matroid(in);
}

void save_matroid(const std::filesystem::path& path, const MatroidState& state) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path.string());
    }
    write_matroid(out, state);
}

} // namespace matroidcore
