// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "utils.h"


/**
 * @brief Replace all occurrences of a substring within a string.
 *
 * @param haystack Input string to search/modify (copied by value).
 * @param needle Substring to replace; an empty needle leaves the input unchanged.
 * @param replacement Replacement substring.
 * @return Modified string with all replacements applied.
 */
std::string replace_all(std::string haystack, std::string_view needle, std::string_view replacement) {
    if (needle.empty()) {
        return haystack;
    }
    std::size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        haystack.replace(pos, needle.size(), replacement);
        pos = haystack.find(needle, pos + replacement.size());
    }
    return haystack;
}
