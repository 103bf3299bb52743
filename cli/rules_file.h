/********************************************************************
 * rules_file.h  –  user rules file for pluralizer-cli
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
#include <utility>
#include <vector>

class Pluralizer;

/**
 * @brief Extra rules read from a TOML file.
 *
 * Recognised sections:
 * @code
 * [plural]
 * '(octop)us$' = "$1odes"
 * [singular]
 * '(octop)odes$' = "$1us"
 * [irregular]
 * mouse = "mice"
 * [uncountable]
 * words = ["sugar", "rice"]
 * patterns = ['craft$']
 * @endcode
 * Double-quoted strings take backslash escapes, single-quoted strings are
 * literal, which is the convenient form for regular expressions.
 */
struct RulesFile {
    std::vector<std::pair<std::string, std::string>> pluralRules;
    std::vector<std::pair<std::string, std::string>> singularRules;
    std::vector<std::pair<std::string, std::string>> irregularRules;
    std::vector<std::string> uncountableWords;
    std::vector<std::string> uncountablePatterns;

    size_t ruleCount() const;
};

/// Parses the contents of a rules file. Unknown sections and keys are ignored.
RulesFile parseRulesToml(const std::string& content);

/**
 * @brief Reads and parses a rules file.
 * @throws std::runtime_error if the file cannot be opened.
 */
RulesFile readRulesFile(const std::string& filePath);

/**
 * @brief Registers every rule of @p rules with @p pluralizer, in file order.
 * @throws std::invalid_argument if a pattern does not compile.
 */
void applyRulesFile(const RulesFile& rules, Pluralizer& pluralizer);
