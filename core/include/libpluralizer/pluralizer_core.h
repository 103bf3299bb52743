/********************************************************************
 * pluralizer_core.h  –  pluralizer core header
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
#include <string>

/// Target form of a transformation.
enum class Direction { Plural, Singular };

// =============================================================================//
// Standalone Functions
// =============================================================================//

/**
 * @brief Gets the version string of the libpluralizer library.
 * @return A string in "MAJOR.MINOR.PATCH" format.
 */
std::string getPluralizerVersion();


// =============================================================================//
// Pluralizer Class
// =============================================================================//
/**
 * @brief Converts English words between their singular and plural forms.
 *
 * A Pluralizer owns three tables: pattern rules (one list per direction),
 * irregular singular/plural pairs and uncountable words. A word is resolved
 * by checking, in order, the uncountable words, the irregular pairs and the
 * pattern rules, most recently registered rule first. Words nothing matches
 * are returned unchanged. The capitalization of the input is kept.
 *
 * All words are UTF-8. Lookups and registrations may be called from several
 * threads at once.
 */
class Pluralizer {
public:
    /**
     * @brief Constructs an empty engine. Call initialize() to load the
     * built-in English rules.
     */
    Pluralizer();

    /**
     * @brief Destroys the engine.
     */
    ~Pluralizer();

    Pluralizer(const Pluralizer&) = delete;
    Pluralizer& operator=(const Pluralizer&) = delete;

    /**
     * @brief Loads the built-in English rules. Only the first call has an
     * effect. Rules registered before the first call keep precedence over
     * the built-in ones.
     */
    void initialize();

    /**
     * @brief Pluralizes or singularizes a word based on a count.
     * @param word The word to convert.
     * @param count A count of 1 selects the singular, anything else the plural.
     * @param inclusive If true, the count and a space are prepended.
     * @return e.g. pluralize("House", 2, true) == "2 Houses".
     */
    std::string pluralize(const std::string& word, long count, bool inclusive) const;

    /** @brief Returns the plural form of a word. */
    std::string toPlural(const std::string& word) const;
    /** @brief Returns the singular form of a word. */
    std::string toSingular(const std::string& word) const;

    /**
     * @brief Converts a word to the given form.
     * @return The converted word, or @p word itself if no rule applies.
     */
    std::string transform(const std::string& word, Direction direction) const;

    /**
     * @brief Adds a pluralization rule.
     * @param pattern A regular expression, matched case-insensitively.
     * @param replacement Replacement for the matched text. $0 is the whole
     * match, $1..$9 are capture groups. An empty replacement keeps the word.
     * @throws std::invalid_argument if the pattern does not compile.
     */
    void addPluralRule(const std::string& pattern, const std::string& replacement);

    /** @brief Adds a singularization rule. Same contract as addPluralRule(). */
    void addSingularRule(const std::string& pattern, const std::string& replacement);

    /** @brief Adds an irregular singular/plural pair, e.g. ("child", "children"). */
    void addIrregularRule(const std::string& singular, const std::string& plural);

    /** @brief Adds a word that is never converted, e.g. "cash". */
    void addUncountableRule(const std::string& word);

    /**
     * @brief Adds a pattern of words that are never converted, e.g. "sheep$".
     * @throws std::invalid_argument if the pattern does not compile.
     */
    void addUncountablePattern(const std::string& pattern);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};


// =============================================================================//
// Default Engine
// =============================================================================//
// The functions below operate on one process-wide Pluralizer with the
// built-in rules loaded.

/** @brief Returns the process-wide engine, initialized on first use. */
Pluralizer& defaultPluralizer();

/** @brief Loads the built-in rules into the process-wide engine. Idempotent. */
void initializePluralizer();

std::string pluralize(const std::string& word, long count, bool inclusive);
std::string toPlural(const std::string& word);
std::string toSingular(const std::string& word);

void addPluralRule(const std::string& pattern, const std::string& replacement);
void addSingularRule(const std::string& pattern, const std::string& replacement);
void addIrregularRule(const std::string& singular, const std::string& plural);
void addUncountableRule(const std::string& word);
void addUncountablePattern(const std::string& pattern);
