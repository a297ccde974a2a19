#ifndef MATROIDCORE_COMMON_HPP
#define MATROIDCORE_COMMON_HPP

#include <string>
#include <vector>
#include <set>
#include <map>
#include <cstdint>
#include <memory>
#include <stdexcept>

namespace matroidcore {

// Version information
constexpr const char* VERSION = "1.0.0";

// Common types
using String = std::string;
using Element = String;                       // Opaque ground set label
using ElementSet = std::set<Element>;         // Subset of the ground set, by label
using ElementMap = std::map<Element, Element>; // Relabeling / isomorphism certificate
using Rank = uint32_t;

// Matroid text format constants
constexpr char SET_OPEN = '{';
constexpr char SET_CLOSE = '}';
constexpr char SET_SEPARATOR = ',';
constexpr char KEY_SEPARATOR = ':';
constexpr char COMMENT_MARKER = '#';

// File extensions
constexpr const char* EXT_MATROID = ".mat"; // Matroid defining data

// Error codes
enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND = 1,
    INVALID_FORMAT = 2,
    INVALID_PARAMETER = 3,
    INVALID_MATROID = 4,
    NOT_ISOMORPHIC = 5,
    UNKNOWN_ERROR = 99
};

/**
 * A defining set refers to an element outside the declared ground set,
 * or a name/label given to the library is not recognised.
 */
class InvalidInputError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * circuit(X) was asked for an independent set X.
 */
class NoCircuitFoundError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Format a set as {a,b,c} (elements in ground set order)
 */
std::string format_set(const ElementSet& set);

/**
 * High-resolution timer for performance measurements
 */
class Timer {
public:
    Timer();
    ~Timer();

    void start();
    void stop();
    double elapsed_seconds() const;
    double elapsed_milliseconds() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Get current process peak memory usage in MB
 * Returns 0.0 if unavailable (non-Linux platform or error reading /proc)
 */
double get_peak_memory_mb();

} // namespace matroidcore

#endif // MATROIDCORE_COMMON_HPP
