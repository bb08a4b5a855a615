#pragma once

#include <cstdint>
#include <iterator>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/** Read an entire file into a string. Throws std::invalid_argument if the file can't be opened. */
std::string read_file(const std::string &fname);

/** Remove leading and trailing whitespace. */
std::string trim(const std::string &s);

/**
 * Split a string by character c. Segments are trimmed and empty segments are dropped, so that
 * "1, 2,,3\n" yields {"1","2","3"}.
 */
std::vector<std::string> split(const std::string &s, char c);

/**
 * Split a string by character c into integer components.
 * @throws std::invalid_argument if a segment is not an integer or doesn't fit into T
 */
template <typename T>
std::vector<T> int_split(const std::string &s, char c) {
    std::vector<T> result;
    for (const std::string &segment : split(s, c)) {
        size_t pos;
        long long v = std::stoll(segment, &pos);
        if (pos != segment.size() || v < static_cast<long long>(std::numeric_limits<T>::min())
            || v > static_cast<long long>(std::numeric_limits<T>::max())) {
            throw std::invalid_argument("Invalid integer: " + segment);
        }
        result.push_back(static_cast<T>(v));
    }
    return result;
}

/**
 * Parses a comma separated list of coin labels ('A'/'B', case insensitive, or '0'/'1') into 0
 * for coin A and 1 for coin B.
 * @throws std::invalid_argument on any other label
 */
std::vector<uint8_t> parse_assignment(const std::string &s);

/**
 * Write a vector to a string, with elements separated by comma.
 */
template <typename T>
std::string to_string(const std::vector<T> &vec) {
    if (vec.empty()) {
        return "[]";
    }
    std::stringstream out;
    out << '[';
    for (uint32_t i = 0; i < vec.size() - 1; ++i) {
        out << +vec[i] << ",";
    }
    out << +vec.back() << ']';
    return out.str();
}

template <typename T>
T sum(const std::vector<T> &vec) {
    return std::accumulate(vec.begin(), vec.end(), T(0));
}
