/**
 * @file Fragment.cpp
 * @brief Sequence number parsing for fragment file names.
 */

#include "domain/Fragment.hpp"
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>

namespace streamscribe::domain {

namespace {

std::optional<std::int64_t> DigitsToNumber(const std::string& digits) {
    if (digits.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    for (char ch : digits) {
        int d = ch - '0';
        if (value > (std::numeric_limits<std::int64_t>::max() - d) / 10) {
            return std::nullopt; // Overflow: treat as unparsable
        }
        value = value * 10 + d;
    }
    return value;
}

bool IsDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

} // namespace

std::optional<std::int64_t> ParseSequenceNumber(const std::string& filename) {
    const std::string stem = std::filesystem::path(filename).stem().string();
    if (stem.empty()) {
        return std::nullopt;
    }

    // Trailing run
    size_t end = stem.size();
    size_t begin = end;
    while (begin > 0 && IsDigit(stem[begin - 1])) {
        --begin;
    }
    if (begin < end) {
        return DigitsToNumber(stem.substr(begin, end - begin));
    }

    // First run anywhere
    size_t first = 0;
    while (first < stem.size() && !IsDigit(stem[first])) {
        ++first;
    }
    size_t last = first;
    while (last < stem.size() && IsDigit(stem[last])) {
        ++last;
    }
    return DigitsToNumber(stem.substr(first, last - first));
}

std::string FormatSequence(std::int64_t sequence) {
    std::ostringstream ss;
    ss << std::setw(3) << std::setfill('0') << sequence;
    return ss.str();
}

} // namespace streamscribe::domain
