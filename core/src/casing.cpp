/********************************************************************
 * casing.cpp  –  casing descriptor helpers
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
#include "casing.h"

#include <vector>

#include <unicode/unistr.h>
#include <unicode/locid.h>
#include <unicode/uchar.h>

namespace {

enum class CharCase { Upper, Lower, None };

inline CharCase charCase(UChar32 c) {
    if (u_isupper(c)) return CharCase::Upper;
    if (u_islower(c)) return CharCase::Lower;
    return CharCase::None;
}

inline std::string toUtf8(const icu::UnicodeString& u) {
    std::string out;
    u.toUTF8String(out);
    return out;
}

// One entry per code point of the source word.
std::vector<CharCase> caseProfile(const icu::UnicodeString& u) {
    std::vector<CharCase> profile;
    for (int32_t i = 0; i < u.length();) {
        UChar32 c = u.char32At(i);
        profile.push_back(charCase(c));
        i += U16_LENGTH(c);
    }
    return profile;
}

icu::UnicodeString applyProfile(const std::vector<CharCase>& profile, const icu::UnicodeString& result) {
    if (profile.empty()) return result;

    icu::UnicodeString out;
    size_t index = 0;
    for (int32_t i = 0; i < result.length();) {
        UChar32 c = result.char32At(i);
        i += U16_LENGTH(c);

        CharCase wanted = index < profile.size() ? profile[index] : profile.back();
        if (wanted == CharCase::Upper) {
            c = u_toupper(c);
        } else if (wanted == CharCase::Lower) {
            c = u_tolower(c);
        }
        out.append(c);
        ++index;
    }
    return out;
}

} // namespace

// ----------------- Case mapping -----------------
std::string toLowerUtf8(const std::string& s) {
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(s);
    u.toLower(icu::Locale::getEnglish());
    return toUtf8(u);
}

// ----------------- Casing descriptor -----------------
Casing detectCasing(const std::string& word) {
    const icu::Locale& english = icu::Locale::getEnglish();
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(word);

    icu::UnicodeString lower(u);
    lower.toLower(english);
    if (lower == u) return Casing::Lower;

    icu::UnicodeString upper(u);
    upper.toUpper(english);
    if (upper == u) return Casing::Upper;

    UChar32 first = u.char32At(0);
    icu::UnicodeString rest = u.tempSubString(U16_LENGTH(first));
    icu::UnicodeString restLower(rest);
    restLower.toLower(english);
    if (u_isupper(first) && rest == restLower) return Casing::Capitalized;

    return Casing::Mixed;
}

std::string applyCasing(const std::string& source, Casing casing, const std::string& result) {
    const icu::Locale& english = icu::Locale::getEnglish();
    icu::UnicodeString r = icu::UnicodeString::fromUTF8(result);

    switch (casing) {
    case Casing::Lower:
        r.toLower(english);
        return toUtf8(r);
    case Casing::Upper:
        r.toUpper(english);
        return toUtf8(r);
    case Casing::Capitalized: {
        if (r.isEmpty()) return result;
        int32_t firstLen = U16_LENGTH(r.char32At(0));
        icu::UnicodeString head = r.tempSubString(0, firstLen);
        icu::UnicodeString tail = r.tempSubString(firstLen);
        head.toUpper(english);
        tail.toLower(english);
        return toUtf8(head + tail);
    }
    case Casing::Mixed:
        break;
    }
    return toUtf8(applyProfile(caseProfile(icu::UnicodeString::fromUTF8(source)), r));
}

std::string restoreCase(const std::string& source, const std::string& result) {
    return applyCasing(source, detectCasing(source), result);
}
