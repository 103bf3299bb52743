/********************************************************************
 * casing.h  –  casing descriptor helpers
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#pragma once
#include <string>

/// Capitalization style of a word.
enum class Casing {
    Lower,       // "house"
    Upper,       // "HOUSE"
    Capitalized, // "House"
    Mixed        // "McDonald", "iPhone"
};

/**
 * @brief Determines the casing descriptor of a UTF-8 word.
 *
 * Words without any cased letter (digits, symbols, empty) are Lower.
 */
Casing detectCasing(const std::string& word);

/**
 * @brief Re-applies the casing of @p source to @p result.
 *
 * Upper and Lower convert the whole result. Capitalized upper-cases the first
 * character and lower-cases the rest. Mixed copies the case of @p source
 * character by character; characters past the end of @p source follow the
 * case of its last character.
 */
std::string applyCasing(const std::string& source, Casing casing, const std::string& result);

/// Convenience overload computing the descriptor from @p source.
std::string restoreCase(const std::string& source, const std::string& result);

/// Lower-cases a UTF-8 string with English case mapping rules.
std::string toLowerUtf8(const std::string& s);
