/********************************************************************
 * default_rules.h  –  built-in English rule set
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

class RuleTable;
class IrregularTable;
class UncountableSet;

/**
 * @brief Fills the given tables with the built-in English rules.
 *
 * Irregular pairs and uncountable words go to their tables. Uncountable
 * patterns ("anything ending in sheep") are appended to both rule tables
 * with an empty replacement after the regular rules, so they are tried first.
 */
void loadDefaultRules(RuleTable& pluralRules, RuleTable& singularRules,
                      IrregularTable& irregulars, UncountableSet& uncountables);
