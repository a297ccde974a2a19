#ifndef MATROIDCORE_FORMATS_MATROID_FILE_HPP
#define MATROIDCORE_FORMATS_MATROID_FILE_HPP

#include "../common.hpp"
#include "../matroids/matroid.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace matroidcore {

/**
 * Plain-text matroid format (.mat)
 *
 * One `key: value` entry per line, '#' starts a comment:
 *
 *   name: Fano
 *   encoding: circuits
 *   groundset: {a,b,c,d,e,f,g}
 *   circuits: {a,b,f}{a,c,e}
 *   flats 1: {a}{b}
 *   lattice: {}{a}{a,b,c}
 *
 * `circuits`, `flats <rank>` and `lattice` lines may repeat and must match
 * the declared encoding. Whitespace inside a value is ignored except in the
 * name. Element labels may not contain whitespace or any of "{},:#".
 *
 * Malformed input throws std::runtime_error naming the offending line.
 * Ground set membership is not checked here; make_matroid() does that.
 */
MatroidState read_matroid(std::istream& is);
MatroidState read_matroid_string(const std::string& text);

// Throws std::invalid_argument if a label cannot be written unambiguously
void write_matroid(std::ostream& os, const MatroidState& state);

// File-based helpers (throw std::runtime_error if the file cannot be opened)
MatroidState load_matroid(const std::filesystem::path& path);
void save_matroid(const std::filesystem::path& path, const MatroidState& state);

} // namespace matroidcore

#endif // MATROIDCORE_FORMATS_MATROID_FILE_HPP
