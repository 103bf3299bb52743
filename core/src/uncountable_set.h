/********************************************************************
 * uncountable_set.h  –  words without a distinct plural
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
#include <unordered_set>

/// Case-insensitive set of words whose singular and plural are identical.
class UncountableSet {
public:
    void add(const std::string& word);
    void merge(const UncountableSet& newer);
    bool contains(const std::string& word) const;

    size_t size() const { return words_.size(); }

private:
    std::unordered_set<std::string> words_;
};
