/********************************************************************
 * rule_table.h  –  ordered pattern rules
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
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <unicode/regex.h>

/**
 * @brief An ordered list of (pattern, replacement) rules for one direction.
 *
 * Patterns are ICU regular expressions compiled case-insensitively. The most
 * recently added rule is tried first.
 *
 * Replacement templates may reference the whole match as $0 and capture
 * groups as $1..$9; a group that did not take part in the match expands to
 * nothing and "$$" is a literal dollar sign. An empty replacement leaves the
 * word untouched.
 */
class RuleTable {
public:
    /**
     * @brief Appends a rule.
     * @throws std::invalid_argument if the pattern is not a valid regular expression.
     */
    void add(const std::string& pattern, const std::string& replacement);

    /// Moves all rules of @p newer behind the rules of this table.
    void append(RuleTable&& newer);

    /**
     * @brief Applies the most recent matching rule to @p word.
     * @return The rewritten word, or std::nullopt if no rule matches.
     */
    std::optional<std::string> match(const std::string& word) const;

    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

private:
    struct Rule {
        std::string source;
        std::unique_ptr<icu::RegexPattern> pattern;
        icu::UnicodeString replacement;
    };

    std::vector<Rule> rules_;
};
