#include <libpluralizer/pluralizer_core.h>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

class PluralizerTest : public ::testing::Test {
protected:
    void SetUp() override { engine.initialize(); }

    Pluralizer engine;
};

const std::vector<std::pair<std::string, std::string>> kRegularNouns = {
    {"house", "houses"},
    {"box", "boxes"},
    {"bus", "buses"},
    {"kiss", "kisses"},
    {"church", "churches"},
    {"dish", "dishes"},
    {"city", "cities"},
    {"baby", "babies"},
    {"day", "days"},
    {"monkey", "monkeys"},
    {"knife", "knives"},
    {"wife", "wives"},
    {"wolf", "wolves"},
    {"leaf", "leaves"},
    {"hero", "heroes"},
    {"potato", "potatoes"},
    {"analysis", "analyses"},
    {"cactus", "cacti"},
    {"matrix", "matrices"},
    {"vertex", "vertices"},
    {"criterion", "criteria"},
    {"datum", "data"},
    {"mouse", "mice"},
    {"person", "people"},
    {"child", "children"},
    {"man", "men"},
    {"woman", "women"},
};

const std::vector<std::string> kUncountables = {
    "sheep", "fish", "blowfish", "deer", "reindeer", "news", "rice",
    "Information", "chinese", "Pokémon", "measles", "you",
};

} // namespace

/* ----------------------------------------------------------------------------
 * pluralize
 * --------------------------------------------------------------------------*/

TEST_F(PluralizerTest, countSelectsForm) {
    EXPECT_EQ(engine.pluralize("House", 2, true), "2 Houses");
    EXPECT_EQ(engine.pluralize("Houses", 1, true), "1 House");
    EXPECT_EQ(engine.pluralize("House", 1, false), "House");
    EXPECT_EQ(engine.pluralize("Houses", 2, false), "Houses");
}

TEST_F(PluralizerTest, onlyOneIsSingular) {
    EXPECT_EQ(engine.pluralize("house", 0, true), "0 houses");
    EXPECT_EQ(engine.pluralize("house", -1, false), "houses");
    EXPECT_EQ(engine.pluralize("house", 1000000, true), "1000000 houses");
}

TEST_F(PluralizerTest, emptyWordIsReturnedUnchanged) {
    EXPECT_EQ(engine.toPlural(""), "");
    EXPECT_EQ(engine.toSingular(""), "");
    EXPECT_EQ(engine.pluralize("", 2, true), "2 ");
}

/* ----------------------------------------------------------------------------
 * casing
 * --------------------------------------------------------------------------*/

TEST_F(PluralizerTest, preservesCase) {
    EXPECT_EQ(engine.toPlural("HOUSE"), "HOUSES");
    EXPECT_EQ(engine.toPlural("House"), "Houses");
    EXPECT_EQ(engine.toPlural("house"), "houses");
    EXPECT_EQ(engine.toSingular("HOUSES"), "HOUSE");
    EXPECT_EQ(engine.toPlural("McDonald"), "McDonalds");
}

TEST_F(PluralizerTest, preservesCaseOfIrregulars) {
    EXPECT_EQ(engine.toPlural("FOOT"), "FEET");
    EXPECT_EQ(engine.toSingular("Teeth"), "Tooth");
}

/* ----------------------------------------------------------------------------
 * default rules
 * --------------------------------------------------------------------------*/

TEST_F(PluralizerTest, pluralizesRegularNouns) {
    for (const auto& [singular, plural] : kRegularNouns) {
        EXPECT_EQ(engine.toPlural(singular), plural) << singular;
    }
}

TEST_F(PluralizerTest, singularizesRegularNouns) {
    for (const auto& [singular, plural] : kRegularNouns) {
        EXPECT_EQ(engine.toSingular(plural), singular) << plural;
    }
}

TEST_F(PluralizerTest, roundTripsRegularNouns) {
    for (const auto& [singular, plural] : kRegularNouns) {
        EXPECT_EQ(engine.toSingular(engine.toPlural(singular)), singular) << singular;
    }
}

TEST_F(PluralizerTest, keepsWordsAlreadyInTargetForm) {
    EXPECT_EQ(engine.toPlural("houses"), "houses");
    EXPECT_EQ(engine.toPlural("children"), "children");
    EXPECT_EQ(engine.toSingular("child"), "child");
    EXPECT_EQ(engine.toSingular("house"), "house");
}

TEST_F(PluralizerTest, usesIrregularTable) {
    EXPECT_EQ(engine.toPlural("foot"), "feet");
    EXPECT_EQ(engine.toPlural("tooth"), "teeth");
    EXPECT_EQ(engine.toPlural("quiz"), "quizzes");
    EXPECT_EQ(engine.toPlural("human"), "humans");
    EXPECT_EQ(engine.toSingular("geese"), "goose");
    EXPECT_EQ(engine.toSingular("humans"), "human");
}

TEST_F(PluralizerTest, irregularTakesPrecedenceOverPatterns) {
    // The generic rule alone would produce "thiefs".
    EXPECT_EQ(engine.toPlural("thief"), "thieves");

    engine.addPluralRule("oot$", "oots");
    EXPECT_EQ(engine.toPlural("foot"), "feet");
    EXPECT_EQ(engine.toPlural("boot"), "boots");
}

TEST_F(PluralizerTest, resolvesIrregularCompounds) {
    EXPECT_EQ(engine.toPlural("Sea-Goose"), "Sea-Geese");
    EXPECT_EQ(engine.toSingular("front teeth"), "front tooth");
    EXPECT_EQ(engine.toPlural("sea-geese"), "sea-geese");
    EXPECT_EQ(engine.toPlural("ice cream"), "ice creams");
}

TEST_F(PluralizerTest, passesThroughNonAsciiEndings) {
    EXPECT_EQ(engine.toPlural("café"), "café");
}

TEST_F(PluralizerTest, unchangedWordKeepsOriginalText) {
    // Lower-casing "İ" and "ẞ" cannot be undone by upper-casing again.
    EXPECT_EQ(engine.toPlural("İSHEEP"), "İSHEEP");
    EXPECT_EQ(engine.toSingular("İSHEEP"), "İSHEEP");
    EXPECT_EQ(engine.toPlural("Straẞe-Deer"), "Straẞe-Deer");
    EXPECT_EQ(engine.toSingular("Straẞe-Deer"), "Straẞe-Deer");
    EXPECT_EQ(engine.pluralize("CAFÉ", 2, true), "2 CAFÉ");
}

/* ----------------------------------------------------------------------------
 * uncountables
 * --------------------------------------------------------------------------*/

TEST_F(PluralizerTest, neverChangesUncountables) {
    for (const auto& word : kUncountables) {
        for (long count : {0L, 1L, 2L, 5L}) {
            EXPECT_EQ(engine.pluralize(word, count, false), word) << word << " x" << count;
        }
    }
}

TEST_F(PluralizerTest, uncountablePluralIsIdempotent) {
    for (const auto& word : kUncountables) {
        EXPECT_EQ(engine.toPlural(engine.toPlural(word)), engine.toPlural(word)) << word;
    }
}

TEST_F(PluralizerTest, addUncountableRule) {
    EXPECT_EQ(engine.toPlural("sugar"), "sugars");

    engine.addUncountableRule("Sugar");

    EXPECT_EQ(engine.pluralize("SUGAR", 2, false), "SUGAR");
    EXPECT_EQ(engine.toSingular("sugar"), "sugar");
}

TEST_F(PluralizerTest, addUncountablePattern) {
    EXPECT_EQ(engine.toPlural("spacecraft"), "spacecrafts");

    engine.addUncountablePattern("craft$");

    EXPECT_EQ(engine.toPlural("Spacecraft"), "Spacecraft");
    EXPECT_EQ(engine.toSingular("hovercraft"), "hovercraft");
}

TEST_F(PluralizerTest, uncountableWinsOverIrregular) {
    engine.addUncountableRule("foot");
    EXPECT_EQ(engine.toPlural("foot"), "foot");
}

/* ----------------------------------------------------------------------------
 * registration
 * --------------------------------------------------------------------------*/

TEST_F(PluralizerTest, newRuleOverridesDefault) {
    EXPECT_EQ(engine.toPlural("person"), "people");

    engine.addPluralRule("(pe)rson$", "$1rsons");

    EXPECT_EQ(engine.toPlural("person"), "persons");
    EXPECT_EQ(engine.toPlural("Person"), "Persons");
}

TEST_F(PluralizerTest, addPluralAndSingularRules) {
    engine.addPluralRule("(matr|cod|mur|sil|vert|ind|append)(?:ix|ex)$", "$1ices");
    engine.addSingularRule("(matr|append)ices$", "$1ix");

    EXPECT_EQ(engine.pluralize("Vertex", 2, false), "Vertices");
    EXPECT_EQ(engine.pluralize("Matrices", 1, false), "Matrix");
}

TEST_F(PluralizerTest, addIrregularRule) {
    engine.addIrregularRule("octopus", "octopodes");

    EXPECT_EQ(engine.toPlural("Octopus"), "Octopodes");
    EXPECT_EQ(engine.toSingular("octopodes"), "octopus");
}

TEST_F(PluralizerTest, reRegisteredIrregularForgetsOldPlural) {
    engine.addIrregularRule("gadget", "gadgetry");
    engine.addIrregularRule("gadget", "gadgets");

    EXPECT_EQ(engine.toPlural("gadget"), "gadgets");
    EXPECT_EQ(engine.toSingular("gadgets"), "gadget");
    EXPECT_EQ(engine.toPlural("gadgetry"), "gadgetries");

    engine.addIrregularRule("ox", "oxes");
    EXPECT_EQ(engine.toSingular("oxes"), "ox");
}

TEST_F(PluralizerTest, emptyReplacementKeepsWord) {
    engine.addPluralRule("ware$", "");
    EXPECT_EQ(engine.toPlural("tableware"), "tableware");
}

TEST_F(PluralizerTest, invalidPatternThrows) {
    EXPECT_THROW(engine.addPluralRule("[", "x"), std::invalid_argument);
    EXPECT_THROW(engine.addSingularRule("(a", "x"), std::invalid_argument);
    EXPECT_THROW(engine.addUncountablePattern("(bad"), std::invalid_argument);

    EXPECT_EQ(engine.toPlural("house"), "houses");
}

/* ----------------------------------------------------------------------------
 * initialize
 * --------------------------------------------------------------------------*/

TEST(PluralizerInitialize, emptyEngineIsIdentity) {
    Pluralizer engine;
    EXPECT_EQ(engine.toPlural("house"), "house");
    EXPECT_EQ(engine.toSingular("houses"), "houses");
}

TEST(PluralizerInitialize, repeatedCallsAreHarmless) {
    Pluralizer engine;
    engine.initialize();
    engine.addPluralRule("(pe)rson$", "$1rsons");
    engine.initialize();
    engine.initialize();

    EXPECT_EQ(engine.toPlural("person"), "persons");
    EXPECT_EQ(engine.toPlural("house"), "houses");
}

TEST(PluralizerInitialize, earlierUserRulesKeepPrecedence) {
    Pluralizer engine;
    engine.addPluralRule("(pe)rson$", "$1rsons");
    engine.addIrregularRule("ox", "oxes");
    engine.addUncountableRule("sugar");

    engine.initialize();

    EXPECT_EQ(engine.toPlural("person"), "persons");
    EXPECT_EQ(engine.toPlural("ox"), "oxes");
    EXPECT_EQ(engine.toPlural("sugar"), "sugar");
    EXPECT_EQ(engine.toPlural("house"), "houses");
}

/* ----------------------------------------------------------------------------
 * default engine
 * --------------------------------------------------------------------------*/

TEST(DefaultPluralizer, freeFunctionsUseBuiltInRules) {
    initializePluralizer();

    EXPECT_EQ(pluralize("House", 2, true), "2 Houses");
    EXPECT_EQ(pluralize("Houses", 1, true), "1 House");
    EXPECT_EQ(toPlural("Tooth"), "Teeth");
    EXPECT_EQ(toSingular("mice"), "mouse");
}

TEST(DefaultPluralizer, freeRegistrationFunctions) {
    addIrregularRule("gizmo", "gizmata");
    addUncountableRule("zorble");
    addUncountablePattern("flarn$");
    addPluralRule("(wug)$", "$1gen");
    addSingularRule("(wug)gen$", "$1");

    EXPECT_EQ(toPlural("gizmo"), "gizmata");
    EXPECT_EQ(toPlural("zorble"), "zorble");
    EXPECT_EQ(toPlural("megaflarn"), "megaflarn");
    EXPECT_EQ(toPlural("wug"), "wuggen");
    EXPECT_EQ(toSingular("wuggen"), "wug");
    EXPECT_EQ(&defaultPluralizer(), &defaultPluralizer());
}

TEST(DefaultPluralizer, concurrentReadsAndWrites) {
    std::vector<std::thread> readers;
    std::vector<int> failures(4, 0);
    for (size_t t = 0; t < failures.size(); ++t) {
        readers.emplace_back([t, &failures] {
            for (int i = 0; i < 200; ++i) {
                if (toPlural("house") != "houses") ++failures[t];
            }
        });
    }
    for (int i = 0; i < 50; ++i) {
        addIrregularRule("thingamajig" + std::to_string(i), "thingamajigs" + std::to_string(i));
    }
    for (auto& reader : readers) {
        reader.join();
    }

    for (int count : failures) {
        EXPECT_EQ(count, 0);
    }
    EXPECT_EQ(toPlural("thingamajig7"), "thingamajigs7");
}
