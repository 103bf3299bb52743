/********************************************************************
 * rules_file.cpp  –  user rules file for pluralizer-cli
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
#include "rules_file.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <libpluralizer/pluralizer_core.h>

namespace fs = std::filesystem;

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

// Position of the first `ch` that is not inside a quoted string.
size_t findUnquoted(const std::string& s, char ch) {
    char quote = '\0';
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (quote == '"' && c == '\\') {
            ++i;
        } else if (quote != '\0') {
            if (c == quote) quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == ch) {
            return i;
        }
    }
    return std::string::npos;
}

std::string unquote(std::string str) {
    if (str.size() >= 2 && str.front() == '\'' && str.back() == '\'') {
        return str.substr(1, str.size() - 2);
    }
    if (!(str.size() >= 2 && str.front() == '"' && str.back() == '"')) {
        return str;
    }
    str = str.substr(1, str.size() - 2);
    std::string result;
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '\\' && i + 1 < str.size()) {
            char next = str[i + 1];
            if (next == 'n')
                result += '\n';
            else if (next == 't')
                result += '\t';
            else
                result += next;
            ++i;
        } else {
            result += str[i];
        }
    }
    return result;
}

// Accepts a single string or a one-line array of strings.
std::vector<std::string> unquoteList(const std::string& value) {
    std::vector<std::string> items;
    if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
        items.push_back(unquote(value));
        return items;
    }
    std::string rest = value.substr(1, value.size() - 2);
    while (!rest.empty()) {
        size_t comma = findUnquoted(rest, ',');
        std::string item = rest.substr(0, comma);
        trim(item);
        if (!item.empty()) items.push_back(unquote(item));
        if (comma == std::string::npos) break;
        rest.erase(0, comma + 1);
    }
    return items;
}

} // namespace

size_t RulesFile::ruleCount() const {
    return pluralRules.size() + singularRules.size() + irregularRules.size() +
           uncountableWords.size() + uncountablePatterns.size();
}

RulesFile parseRulesToml(const std::string& content) {
    RulesFile rules;
    std::istringstream iss(content);
    std::string line, section;
    while (std::getline(iss, line)) {
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line[0] == '[' && line.back() == ']') {
            section = line.substr(1, line.size() - 2);
            trim(section);
            continue;
        }
        size_t eqPos = findUnquoted(line, '=');
        if (eqPos == std::string::npos)
            continue;
        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);
        size_t commentPos = findUnquoted(value, '#');
        if (commentPos != std::string::npos) {
            value = value.substr(0, commentPos);
        }
        trim(key);
        trim(value);
        key = unquote(key);

        if (section == "plural") {
            rules.pluralRules.emplace_back(key, unquote(value));
        } else if (section == "singular") {
            rules.singularRules.emplace_back(key, unquote(value));
        } else if (section == "irregular") {
            rules.irregularRules.emplace_back(key, unquote(value));
        } else if (section == "uncountable") {
            std::vector<std::string> items = unquoteList(value);
            if (key == "words") {
                rules.uncountableWords.insert(rules.uncountableWords.end(), items.begin(), items.end());
            } else if (key == "patterns") {
                rules.uncountablePatterns.insert(rules.uncountablePatterns.end(), items.begin(), items.end());
            }
        }
    }
    return rules;
}

RulesFile readRulesFile(const std::string& filePath) {
    if (!fs::exists(filePath)) {
        throw std::runtime_error("Could not locate rules file: " + filePath);
    }
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open rules file: " + filePath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseRulesToml(buffer.str());
}

void applyRulesFile(const RulesFile& rules, Pluralizer& pluralizer) {
    for (const auto& [pattern, replacement] : rules.pluralRules) {
        pluralizer.addPluralRule(pattern, replacement);
    }
    for (const auto& [pattern, replacement] : rules.singularRules) {
        pluralizer.addSingularRule(pattern, replacement);
    }
    for (const auto& [singular, plural] : rules.irregularRules) {
        pluralizer.addIrregularRule(singular, plural);
    }
    for (const auto& word : rules.uncountableWords) {
        pluralizer.addUncountableRule(word);
    }
    for (const auto& pattern : rules.uncountablePatterns) {
        pluralizer.addUncountablePattern(pattern);
    }
}
