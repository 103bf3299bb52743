/********************************************************************
 * pluralizer_core.cpp  –  pluralizer core implementation.
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
#include "libpluralizer/pluralizer_core.h"

#include <mutex>
#include <shared_mutex>
#include <utility>

#include "casing.h"
#include "default_rules.h"
#include "irregular_table.h"
#include "rule_table.h"
#include "uncountable_set.h"

// =============================================================================//
// Standalone Function Implementations
// =============================================================================//

std::string getPluralizerVersion() {
    // This macro is defined by the CMake build script
    return PLURALIZER_VERSION;
}


// =============================================================================//
// Pluralizer Implementation (PImpl Idiom)
// =============================================================================//
class Pluralizer::Impl {
public:
    RuleTable pluralRules_;
    RuleTable singularRules_;
    IrregularTable irregulars_;
    UncountableSet uncountables_;

    mutable std::shared_mutex mutex_;
    std::once_flag initialized_;

    void loadDefaults();
    std::string transform(const std::string& word, Direction direction) const;

    const RuleTable& rules(Direction direction) const {
        return direction == Direction::Plural ? pluralRules_ : singularRules_;
    }
};

// Builds the default tables and replays whatever was registered so far on
// top of them, so earlier user rules still win.
void Pluralizer::Impl::loadDefaults() {
    RuleTable pluralRules;
    RuleTable singularRules;
    IrregularTable irregulars;
    UncountableSet uncountables;
    loadDefaultRules(pluralRules, singularRules, irregulars, uncountables);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    pluralRules.append(std::move(pluralRules_));
    singularRules.append(std::move(singularRules_));
    irregulars.merge(irregulars_);
    uncountables.merge(uncountables_);

    pluralRules_ = std::move(pluralRules);
    singularRules_ = std::move(singularRules);
    irregulars_ = std::move(irregulars);
    uncountables_ = std::move(uncountables);
}

std::string Pluralizer::Impl::transform(const std::string& word, Direction direction) const {
    if (word.empty()) return word;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::string token = toLowerUtf8(word);

    if (uncountables_.contains(token)) {
        return word;
    }

    // Already in the requested form, e.g. toPlural("children").
    if (irregulars_.contains(token, direction)) {
        return word;
    }

    if (auto counterpart = irregulars_.lookup(token, direction)) {
        return restoreCase(word, *counterpart);
    }

    if (auto rewritten = rules(direction).match(token)) {
        // Lower-casing is not always reversible ("İ", "ẞ"), so an unchanged
        // token must hand back the input itself.
        if (*rewritten == token) return word;
        return restoreCase(word, *rewritten);
    }

    return word;
}

//  Public Pluralizer methods forwarding to Impl

Pluralizer::Pluralizer() : pImpl(std::make_unique<Impl>()) {}
Pluralizer::~Pluralizer() = default;

void Pluralizer::initialize() {
    std::call_once(pImpl->initialized_, [this] { pImpl->loadDefaults(); });
}

std::string Pluralizer::pluralize(const std::string& word, long count, bool inclusive) const {
    std::string result = transform(word, count == 1 ? Direction::Singular : Direction::Plural);
    if (inclusive) {
        return std::to_string(count) + " " + result;
    }
    return result;
}

std::string Pluralizer::toPlural(const std::string& word) const {
    return transform(word, Direction::Plural);
}

std::string Pluralizer::toSingular(const std::string& word) const {
    return transform(word, Direction::Singular);
}

std::string Pluralizer::transform(const std::string& word, Direction direction) const {
    return pImpl->transform(word, direction);
}

void Pluralizer::addPluralRule(const std::string& pattern, const std::string& replacement) {
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex_);
    pImpl->pluralRules_.add(pattern, replacement);
}

void Pluralizer::addSingularRule(const std::string& pattern, const std::string& replacement) {
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex_);
    pImpl->singularRules_.add(pattern, replacement);
}

void Pluralizer::addIrregularRule(const std::string& singular, const std::string& plural) {
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex_);
    pImpl->irregulars_.add(singular, plural);
}

void Pluralizer::addUncountableRule(const std::string& word) {
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex_);
    pImpl->uncountables_.add(word);
}

void Pluralizer::addUncountablePattern(const std::string& pattern) {
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex_);
    // An invalid pattern throws before either table changes.
    pImpl->pluralRules_.add(pattern, "");
    pImpl->singularRules_.add(pattern, "");
}


// =============================================================================//
// Default Engine
// =============================================================================//

Pluralizer& defaultPluralizer() {
    static Pluralizer engine;
    engine.initialize();
    return engine;
}

void initializePluralizer() {
    defaultPluralizer();
}

std::string pluralize(const std::string& word, long count, bool inclusive) {
    return defaultPluralizer().pluralize(word, count, inclusive);
}

std::string toPlural(const std::string& word) {
    return defaultPluralizer().toPlural(word);
}

std::string toSingular(const std::string& word) {
    return defaultPluralizer().toSingular(word);
}

void addPluralRule(const std::string& pattern, const std::string& replacement) {
    defaultPluralizer().addPluralRule(pattern, replacement);
}

void addSingularRule(const std::string& pattern, const std::string& replacement) {
    defaultPluralizer().addSingularRule(pattern, replacement);
}

void addIrregularRule(const std::string& singular, const std::string& plural) {
    defaultPluralizer().addIrregularRule(singular, plural);
}

void addUncountableRule(const std::string& word) {
    defaultPluralizer().addUncountableRule(word);
}

void addUncountablePattern(const std::string& pattern) {
    defaultPluralizer().addUncountablePattern(pattern);
}
