// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_UTILITIES_UTILS_H
#define LOCKSTEP_SRC_UTILITIES_UTILS_H

#include <concepts>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

template<std::integral T>
constexpr T div_ceil(T dividend, T divisor) {
    return (dividend + divisor - 1) / divisor;
}

template<std::integral Dst, std::integral Src>
constexpr Dst narrow(Src input) {
    if constexpr (std::is_signed_v<Src>) {
        if (std::is_unsigned_v<Dst> && input < 0) {
            throw std::out_of_range("Cannot convert negative number to unsigned");
        }
        if (std::is_signed_v<Dst> && input < std::numeric_limits<Dst>::min())
        {
            throw std::out_of_range("Out of range in integer conversion: underflow");
        }
    }

    if (std::cmp_greater(input, std::numeric_limits<Dst>::max()))
    {
        throw std::out_of_range("Out of range in integer conversion: overflow");
    }

    return static_cast<Dst>(input);
}

// ----------------------------------------------------------------------------
//! Replaces every occurrence of `needle` in `haystack`.
std::string replace_all(std::string haystack, std::string_view needle, std::string_view replacement);

#endif //LOCKSTEP_SRC_UTILITIES_UTILS_H
