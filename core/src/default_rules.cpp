/********************************************************************
 * default_rules.cpp  –  built-in English rule set
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
#include "default_rules.h"

#include "irregular_table.h"
#include "rule_table.h"
#include "uncountable_set.h"

namespace {

struct RulePair {
    const char* first;
    const char* second;
};

// Rules are listed from most general to most specific; later entries win.
const RulePair kPluralRules[] = {
    {R"(s?$)", "s"},
    {R"([^\u0000-\u007F]$)", ""},
    {R"(([^aeiou]ese)$)", "$1"},
    {R"((ax|test)is$)", "$1es"},
    {R"((alias|[^aou]us|t[lm]as|gas|ris)$)", "$1es"},
    {R"((e[mn]u)s?$)", "$1s"},
    {R"(([^l]ias|[aeiou]las|[ejzr]as|[iu]am)$)", "$1"},
    {R"((alumn|syllab|vir|radi|nucle|fung|cact|stimul|termin|bacill|foc|uter|loc|strat)(?:us|i)$)", "$1i"},
    {R"((alumn|alg|vertebr)(?:a|ae)$)", "$1ae"},
    {R"((seraph|cherub)(?:im)?$)", "$1im"},
    {R"((her|at|gr)o$)", "$1oes"},
    {R"((agend|addend|millenni|dat|extrem|bacteri|desiderat|strat|candelabr|errat|ov|symposi|curricul|automat|quor)(?:a|um)$)", "$1a"},
    {R"((apheli|hyperbat|periheli|asyndet|noumen|phenomen|criteri|organ|prolegomen|hedr|automat)(?:a|on)$)", "$1a"},
    {R"(sis$)", "ses"},
    {R"((?:(kni|wi|li)fe|(ar|l|ea|eo|oa|hoo)f)$)", "$1$2ves"},
    {R"(([^aeiouy]|qu)y$)", "$1ies"},
    {R"(([^ch][ieo][ln])ey$)", "$1ies"},
    {R"((x|ch|ss|sh|zz)$)", "$1es"},
    {R"((matr|cod|mur|sil|vert|ind|append)(?:ix|ex)$)", "$1ices"},
    {R"(\b((?:tit)?m|l)(?:ice|ouse)$)", "$1ice"},
    {R"((pe)(?:rson|ople)$)", "$1ople"},
    {R"((child)(?:ren)?$)", "$1ren"},
    {R"(eaux$)", "$0"},
    {R"(m[ae]n$)", "men"},
    {R"(^thou$)", "you"},
};

const RulePair kSingularRules[] = {
    {R"((.)s$)", "$1"},
    {R"((ss)$)", "$1"},
    {R"((wi|kni|(?:after|half|high|low|mid|non|night|[^\w]|^)li)ves$)", "$1fe"},
    {R"((ar|(?:wo|[ae])l|[eo][ao])ves$)", "$1f"},
    {R"(ies$)", "y"},
    {R"((dg|ss|ois|lk|ok|wn|mb|th|ch|ec|oal|is|ck|ix|sser|ts|wb)ies$)", "$1ie"},
    {R"(\b(l|(?:neck|cross|hog|aun)?t|coll|faer|food|gen|goon|group|hipp|junk|vegg|(?:pork)?p|charl|calor|cut)ies$)", "$1ie"},
    {R"(\b(mon|smil)ies$)", "$1ey"},
    {R"(\b((?:tit)?m|l)ice$)", "$1ouse"},
    {R"((seraph|cherub)im$)", "$1"},
    {R"((x|ch|ss|sh|zz|tto|go|cho|alias|[^aou]us|t[lm]as|gas|(?:her|at|gr)o|[aeiou]ris)(?:es)?$)", "$1"},
    {R"((analy|diagno|parenthe|progno|synop|the|empha|cri|ne)(?:sis|ses)$)", "$1sis"},
    {R"((movie|twelve|abuse|e[mn]u)s$)", "$1"},
    {R"((test)(?:is|es)$)", "$1is"},
    {R"((alumn|syllab|vir|radi|nucle|fung|cact|stimul|termin|bacill|foc|uter|loc|strat)(?:us|i)$)", "$1us"},
    {R"((agend|addend|millenni|dat|extrem|bacteri|desiderat|strat|candelabr|errat|ov|symposi|curricul|quor)a$)", "$1um"},
    {R"((apheli|hyperbat|periheli|asyndet|noumen|phenomen|criteri|organ|prolegomen|hedr|automat)a$)", "$1on"},
    {R"((alumn|alg|vertebr)ae$)", "$1a"},
    {R"((cod|mur|sil|vert|ind)ices$)", "$1ex"},
    {R"((matr|append)ices$)", "$1ix"},
    {R"((pe)(rson|ople)$)", "$1rson"},
    {R"((child)ren$)", "$1"},
    {R"((eau)x?$)", "$1"},
    {R"(men$)", "man"},
};

const RulePair kIrregularRules[] = {
    // Pronouns and verbs.
    {"I", "we"},
    {"me", "us"},
    {"he", "they"},
    {"she", "they"},
    {"them", "them"},
    {"myself", "ourselves"},
    {"yourself", "yourselves"},
    {"itself", "themselves"},
    {"herself", "themselves"},
    {"himself", "themselves"},
    {"themself", "themselves"},
    {"is", "are"},
    {"was", "were"},
    {"has", "have"},
    {"this", "these"},
    {"that", "those"},
    // Consonant followed by "o".
    {"echo", "echoes"},
    {"dingo", "dingoes"},
    {"volcano", "volcanoes"},
    {"tornado", "tornadoes"},
    {"torpedo", "torpedoes"},
    // Ends with "us".
    {"genus", "genera"},
    {"viscus", "viscera"},
    // Ends with "ma".
    {"stigma", "stigmata"},
    {"stoma", "stomata"},
    {"dogma", "dogmata"},
    {"lemma", "lemmata"},
    {"schema", "schemata"},
    {"anathema", "anathemata"},
    {"ox", "oxen"},
    {"axe", "axes"},
    {"die", "dice"},
    {"yes", "yeses"},
    {"foot", "feet"},
    {"eave", "eaves"},
    {"goose", "geese"},
    {"tooth", "teeth"},
    {"quiz", "quizzes"},
    {"human", "humans"},
    {"proof", "proofs"},
    {"carve", "carves"},
    {"valve", "valves"},
    {"looey", "looies"},
    {"thief", "thieves"},
    {"groove", "grooves"},
    {"pickaxe", "pickaxes"},
    {"passerby", "passersby"},
};

const char* const kUncountableWords[] = {
    "adulthood", "advice", "agenda", "aid", "aircraft", "alcohol", "ammo",
    "analytics", "anime", "athletics", "audio", "bison", "blood", "bream",
    "buffalo", "butter", "carp", "cash", "chassis", "chess", "clothing",
    "cod", "commerce", "cooperation", "corps", "debris", "diabetes",
    "digestion", "elk", "energy", "equipment", "excretion", "expertise",
    "firmware", "flounder", "fun", "gallows", "garbage", "graffiti",
    "hardware", "headquarters", "health", "herpes", "highjinks", "homework",
    "housework", "information", "jeans", "justice", "kudos", "labour",
    "literature", "machinery", "mackerel", "mail", "media", "mews", "moose",
    "music", "mud", "manga", "news", "only", "personnel", "pike", "plankton",
    "pliers", "police", "pollution", "premises", "rain", "research", "rice",
    "salmon", "scissors", "series", "sewage", "shambles", "shrimp",
    "software", "staff", "swine", "tennis", "traffic", "transportation",
    "trout", "tuna", "wealth", "welfare", "whiting", "wildebeest",
    "wildlife", "you",
};

const char* const kUncountablePatterns[] = {
    "pok[eé]mon$",
    "[^aeiou]ese$", // "chinese", "japanese"
    "deer$",        // "deer", "reindeer"
    "fish$",        // "fish", "blowfish", "angelfish"
    "measles$",
    "o[iu]s$",      // "carnivorous"
    "pox$",         // "chickenpox", "smallpox"
    "sheep$",
};

} // namespace

void loadDefaultRules(RuleTable& pluralRules, RuleTable& singularRules,
                      IrregularTable& irregulars, UncountableSet& uncountables) {
    for (const auto& rule : kIrregularRules) {
        irregulars.add(rule.first, rule.second);
    }
    for (const auto& rule : kPluralRules) {
        pluralRules.add(rule.first, rule.second);
    }
    for (const auto& rule : kSingularRules) {
        singularRules.add(rule.first, rule.second);
    }
    for (const char* word : kUncountableWords) {
        uncountables.add(word);
    }
    for (const char* pattern : kUncountablePatterns) {
        pluralRules.add(pattern, "");
        singularRules.add(pattern, "");
    }
}
