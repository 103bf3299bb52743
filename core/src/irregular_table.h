/********************************************************************
 * irregular_table.h  –  irregular singular/plural pairs
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
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "libpluralizer/pluralizer_core.h"

/**
 * @brief Bidirectional table of words that do not follow the pattern rules.
 *
 * Keys are stored lower-cased. Lookups also match the last element of a
 * compound word separated by a space, hyphen or underscore, so "sea-goose"
 * resolves through "goose".
 */
class IrregularTable {
public:
    /**
     * @brief Registers a pair. A later pair replaces an earlier one sharing either key.
     *
     * Re-registering a singular also drops the reverse entry of its old
     * plural, so "cacti" stops singularizing once "cactus" maps to "cactuses".
     * Several singulars may still share one plural ("he", "she" -> "they").
     */
    void add(const std::string& singular, const std::string& plural);

    /// Registers every pair of @p newer over this table, as add() would.
    void merge(const IrregularTable& newer);

    /**
     * @brief Returns the counterpart of a lower-cased word in the given direction.
     *
     * For Direction::Plural the word is looked up among the singulars, for
     * Direction::Singular among the plurals.
     */
    std::optional<std::string> lookup(const std::string& token, Direction direction) const;

    /// True if the lower-cased word already has the target form of some pair.
    bool contains(const std::string& token, Direction direction) const;

    size_t size() const { return singulars_.size(); }

private:
    using Map = std::unordered_map<std::string, std::string>;

    const Map& sourceMap(Direction direction) const;
    const Map& targetMap(Direction direction) const;

    Map singulars_; // singular -> plural
    Map plurals_;   // plural -> singular
};

/// Splits a compound word at its last separator: ("sea-", "goose").
/// The prefix is empty when the word has no separator.
std::pair<std::string, std::string> splitCompound(const std::string& token);
