/********************************************************************
 * cli_args.cpp  –  argument helpers for pluralizer-cli
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
#include "cli_args.h"

#include <stdexcept>

std::optional<Command> parseCommand(const std::string& word) {
    if (word == "pluralize") return Command::Pluralize;
    if (word == "plural") return Command::Plural;
    if (word == "singular") return Command::Singular;
    if (word == "version" || word == "--version") return Command::Version;
    if (word == "help") return Command::Help;
    return std::nullopt;
}

std::optional<long> parseCount(const std::string& text) {
    size_t consumed = 0;
    long count = 0;
    try {
        count = std::stol(text, &consumed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (consumed != text.size()) return std::nullopt;
    return count;
}
