/********************************************************************
 * uncountable_set.cpp  –  words without a distinct plural
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
#include "uncountable_set.h"

#include "casing.h"

void UncountableSet::add(const std::string& word) {
    words_.insert(toLowerUtf8(word));
}

void UncountableSet::merge(const UncountableSet& newer) {
    words_.insert(newer.words_.begin(), newer.words_.end());
}

bool UncountableSet::contains(const std::string& word) const {
    return words_.count(toLowerUtf8(word)) > 0;
}
