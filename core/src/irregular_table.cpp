/********************************************************************
 * irregular_table.cpp  –  irregular singular/plural pairs
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
#include "irregular_table.h"

#include "casing.h"

std::pair<std::string, std::string> splitCompound(const std::string& token) {
    size_t pos = token.find_last_of(" -_");
    if (pos == std::string::npos || pos + 1 == token.size()) {
        return {std::string(), token};
    }
    return {token.substr(0, pos + 1), token.substr(pos + 1)};
}

void IrregularTable::add(const std::string& singular, const std::string& plural) {
    std::string s = toLowerUtf8(singular);
    std::string p = toLowerUtf8(plural);

    // The plural this singular used to map to no longer singularizes back to it.
    auto old = singulars_.find(s);
    if (old != singulars_.end() && old->second != p) {
        auto reverse = plurals_.find(old->second);
        if (reverse != plurals_.end() && reverse->second == s) {
            plurals_.erase(reverse);
        }
    }

    singulars_[s] = p;
    plurals_[p] = s;
}

void IrregularTable::merge(const IrregularTable& newer) {
    for (const auto& [s, p] : newer.singulars_) {
        add(s, p);
    }
    for (const auto& [p, s] : newer.plurals_) {
        plurals_[p] = s;
    }
}

const IrregularTable::Map& IrregularTable::sourceMap(Direction direction) const {
    return direction == Direction::Plural ? singulars_ : plurals_;
}

const IrregularTable::Map& IrregularTable::targetMap(Direction direction) const {
    return direction == Direction::Plural ? plurals_ : singulars_;
}

std::optional<std::string> IrregularTable::lookup(const std::string& token, Direction direction) const {
    const Map& map = sourceMap(direction);

    auto it = map.find(token);
    if (it != map.end()) {
        return it->second;
    }

    auto [prefix, tail] = splitCompound(token);
    if (prefix.empty()) return std::nullopt;

    it = map.find(tail);
    if (it != map.end()) {
        return prefix + it->second;
    }
    return std::nullopt;
}

bool IrregularTable::contains(const std::string& token, Direction direction) const {
    const Map& map = targetMap(direction);
    if (map.count(token)) return true;

    auto [prefix, tail] = splitCompound(token);
    return !prefix.empty() && map.count(tail) > 0;
}
