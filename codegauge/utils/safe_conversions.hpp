#ifndef CODEGAUGE_UTILS_SAFE_CONVERSIONS_HPP
#define CODEGAUGE_UTILS_SAFE_CONVERSIONS_HPP

#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>
#include <string>
#include <stdexcept>
#include <type_traits>
#include <cmath>

namespace codegauge::utils {

template<typename To, typename From>
To safe_cast(From value) {
    static_assert(std::is_arithmetic_v<From> && std::is_arithmetic_v<To>,
                 "safe_cast can only be used with arithmetic types");

    if constexpr (std::is_same_v<To, From>) {
        return value;
    }
    else if constexpr (std::is_floating_point_v<From> && std::is_integral_v<To>) {
        if (value > static_cast<From>(std::numeric_limits<To>::max()) ||
            value < static_cast<From>(std::numeric_limits<To>::min()) ||
            value != std::floor(value)) {
            throw std::overflow_error("Safe cast would lose precision or overflow");
        }
        return static_cast<To>(value);
    }
    else if constexpr (std::is_unsigned_v<From> && std::is_integral_v<To>) {
        if (value > static_cast<std::make_unsigned_t<To>>(std::numeric_limits<To>::max())) {
            throw std::overflow_error("Safe cast would overflow");
        }
        return static_cast<To>(value);
    }
    else {
        if (value > std::numeric_limits<To>::max() ||
            value < std::numeric_limits<To>::lowest()) {
            throw std::overflow_error("Safe cast would overflow");
        }
        return static_cast<To>(value);
    }
}

// tree-sitter addresses source text with 32-bit byte offsets.
inline uint32_t safe_string_length(const std::string& str) {
    return safe_cast<uint32_t>(str.length());
}

// tree-sitter rows are zero based, reports are one based.
inline std::size_t to_line_number(uint32_t row) {
    return static_cast<std::size_t>(row) + 1;
}

} // namespace codegauge::utils

#endif // CODEGAUGE_UTILS_SAFE_CONVERSIONS_HPP
