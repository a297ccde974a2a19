#include "catalog.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace matroidcore {
namespace catalog {

namespace {
    ElementSet letters(size_t count) {
        ElementSet result;
        for (size_t i = 0; i < count; ++i) {
            result.insert(std::string(1, static_cast<char>('a' + i)));
        }
        return result;
    }

    ElementSet chars(const std::string& labels) {
        ElementSet result;
        for (char c : labels) {
            result.insert(std::string(1, c));
        }
        return result;
    }

    // k-subsets of a list, in lexicographic order of positions
    std::vector<ElementSet> combinations(const std::vector<Element>& items, size_t k) {
        std::vector<ElementSet> result;
        if (k > items.size()) {
            return result;
        }
        std::vector<bool> mask(items.size(), false);
        std::fill(mask.begin(), mask.begin() + k, true);
        do {
            ElementSet subset;
            for (size_t i = 0; i < items.size(); ++i) {
                if (mask[i]) {
                    subset.insert(items[i]);
                }
            }
            result.push_back(std::move(subset));
        } while (std::prev_permutation(mask.begin(), mask.end()));
        return result;
    }

    /**
     * Rank-3 paving matroid: the given lines plus every 4-set containing no line
     */
    CircuitsMatroid rank3_paving(const ElementSet& groundset,
                                 const std::vector<ElementSet>& lines,
                                 const std::string& name) {
        std::vector<ElementSet> circuits = lines;
        const std::vector<Element> items(groundset.begin(), groundset.end());
        for (const auto& quad : combinations(items, 4)) {
            bool has_line = false;
            for (const auto& line : lines) {
                if (std::includes(quad.begin(), quad.end(), line.begin(), line.end())) {
                    has_line = true;
                    break;
                }
            }
            if (!has_line) {
                circuits.push_back(quad);
            }
        }
        return CircuitsMatroid(groundset, circuits, name);
    }

    std::vector<ElementSet> fano_lines() {
        return {chars("abf"), chars("ace"), chars("adg"), chars("bcd"),
                chars("beg"), chars("cfg"), chars("def")};
    }

    size_t parse_count(const std::string& text, const std::string& name) {
        if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw InvalidInputError("Bad parameter in catalog name '" + name + "'");
        }
        try {
            return std::stoul(text);
        } catch (const std::out_of_range&) {
            throw InvalidInputError("Parameter out of range in catalog name '" + name + "'");
        }
    }
}

CircuitsMatroid uniform(Rank r, size_t n) {
    if (r > n) {
        throw InvalidInputError("Uniform matroid U(" + std::to_string(r) + ", " + std::to_string(n) +
                                ") has rank above its size");
    }
    std::vector<Element> items;
    for (size_t i = 0; i < n; ++i) {
        items.push_back(std::to_string(i));
    }
    std::vector<ElementSet> circuits;
    if (r < n) {
        circuits = combinations(items, r + 1);
    }
    return CircuitsMatroid(ElementSet(items.begin(), items.end()), circuits,
                           "U(" + std::to_string(r) + ", " + std::to_string(n) + ")");
}

CircuitsMatroid fano() {
    return rank3_paving(letters(7), fano_lines(), "Fano");
}

CircuitsMatroid non_fano() {
    auto lines = fano_lines();
    lines.pop_back();  // relax def
    return rank3_paving(letters(7), lines, "NonFano");
}

CircuitsMatroid k4() {
    // Edges a=01, b=02, c=03, d=12, e=13, f=23: four triangles, three 4-cycles
    std::vector<ElementSet> circuits = {chars("abd"), chars("ace"), chars("bcf"), chars("def"),
                                        chars("acdf"), chars("abef"), chars("bcde")};
    return CircuitsMatroid(letters(6), circuits, "M(K4)");
}

CircuitsMatroid theta(size_t n) {
    if (n < 2) {
        throw InvalidInputError("Theta_n is defined for n >= 2, got " + std::to_string(n));
    }
    std::vector<Element> xs;
    std::vector<Element> ys;
    for (size_t i = 1; i <= n; ++i) {
        xs.push_back("x" + std::to_string(i));
        ys.push_back("y" + std::to_string(i));
    }
    auto ys_without = [&](size_t u) {
        ElementSet result(ys.begin(), ys.end());
        result.erase(ys[u]);
        return result;
    };

    std::vector<ElementSet> circuits = combinations(xs, 3);
    for (size_t i = 0; i < n; ++i) {
        ElementSet c = ys_without(i);
        c.insert(xs[i]);
        circuits.push_back(std::move(c));
    }
    for (size_t u = 0; u < n; ++u) {
        for (size_t s = 0; s < n; ++s) {
            for (size_t t = s + 1; t < n; ++t) {
                if (u == s || u == t) {
                    continue;
                }
                ElementSet c = ys_without(u);
                c.insert(xs[s]);
                c.insert(xs[t]);
                circuits.push_back(std::move(c));
            }
        }
    }

    ElementSet groundset(xs.begin(), xs.end());
    groundset.insert(ys.begin(), ys.end());
    return CircuitsMatroid(groundset, circuits, "Theta_" + std::to_string(n));
}

std::vector<std::string> names() {
    return {"fano", "nonfano", "k4", "theta<n>", "uniform<r>,<n>"};
}

std::unique_ptr<Matroid> named_matroid(const std::string& name) {
    if (name == "fano") {
        return std::make_unique<CircuitsMatroid>(fano());
    }
    if (name == "nonfano") {
        return std::make_unique<CircuitsMatroid>(non_fano());
    }
    if (name == "k4") {
        return std::make_unique<CircuitsMatroid>(k4());
    }
    if (name.rfind("theta", 0) == 0) {
        return std::make_unique<CircuitsMatroid>(theta(parse_count(name.substr(5), name)));
    }
    if (name.rfind("uniform", 0) == 0) {
        std::string params = name.substr(7);
        size_t comma = params.find(',');
        if (comma == std::string::npos) {
            throw InvalidInputError("Expected uniform<r>,<n>, got '" + name + "'");
        }
        size_t r = parse_count(params.substr(0, comma), name);
        size_t n = parse_count(params.substr(comma + 1), name);
        if (r > n) {
            throw InvalidInputError("Rank above size in catalog name '" + name + "'");
        }
        return std::make_unique<CircuitsMatroid>(uniform(static_cast<Rank>(r), n));
    }
    throw InvalidInputError("Unknown catalog matroid: '" + name + "'");
}

} // namespace catalog
} // namespace matroidcore
