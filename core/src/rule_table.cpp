/********************************************************************
 * rule_table.cpp  –  ordered pattern rules
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
#include "rule_table.h"

#include <iterator>
#include <stdexcept>

#include <unicode/parseerr.h>
#include <unicode/utypes.h>

namespace {

// Expands $0..$9 and $$ in a replacement template against the current match.
icu::UnicodeString expandTemplate(const icu::UnicodeString& tpl, icu::RegexMatcher& matcher, UErrorCode& status) {
    icu::UnicodeString out;
    for (int32_t i = 0; i < tpl.length(); ++i) {
        char16_t c = tpl.charAt(i);
        if (c == u'$' && i + 1 < tpl.length()) {
            char16_t next = tpl.charAt(i + 1);
            if (next == u'$') {
                out.append(next);
                ++i;
                continue;
            }
            if (next >= u'0' && next <= u'9') {
                int32_t group = next - u'0';
                ++i;
                // Groups that did not participate in the match expand to nothing.
                if (group <= matcher.groupCount() && matcher.start(group, status) != -1) {
                    out.append(matcher.group(group, status));
                }
                continue;
            }
        }
        out.append(c);
    }
    return out;
}

} // namespace

void RuleTable::add(const std::string& pattern, const std::string& replacement) {
    UParseError parseError;
    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexPattern> compiled(icu::RegexPattern::compile(
        icu::UnicodeString::fromUTF8(pattern), UREGEX_CASE_INSENSITIVE, parseError, status));
    if (U_FAILURE(status)) {
        throw std::invalid_argument("Invalid rule pattern '" + pattern + "': " + u_errorName(status) +
                                    " at offset " + std::to_string(parseError.offset));
    }
    rules_.push_back(Rule{pattern, std::move(compiled), icu::UnicodeString::fromUTF8(replacement)});
}

void RuleTable::append(RuleTable&& newer) {
    rules_.insert(rules_.end(),
                  std::make_move_iterator(newer.rules_.begin()),
                  std::make_move_iterator(newer.rules_.end()));
    newer.rules_.clear();
}

std::optional<std::string> RuleTable::match(const std::string& word) const {
    icu::UnicodeString input = icu::UnicodeString::fromUTF8(word);

    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::RegexMatcher> matcher(it->pattern->matcher(input, status));
        if (U_FAILURE(status)) {
            throw std::runtime_error("Could not create matcher for rule '" + it->source + "': " + u_errorName(status));
        }
        if (!matcher->find(status)) continue;

        if (it->replacement.isEmpty()) {
            return word;
        }

        int32_t start = matcher->start(status);
        int32_t end = matcher->end(status);
        icu::UnicodeString result = input.tempSubString(0, start);
        result.append(expandTemplate(it->replacement, *matcher, status));
        result.append(input.tempSubString(end));
        if (U_FAILURE(status)) {
            throw std::runtime_error("Failed to apply rule '" + it->source + "': " + u_errorName(status));
        }

        std::string out;
        result.toUTF8String(out);
        return out;
    }
    return std::nullopt;
}
