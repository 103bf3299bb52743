/********************************************************************
 * cli_args.h  –  argument helpers for pluralizer-cli
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

/// Commands understood by pluralizer-cli.
enum class Command {
    Pluralize,
    Plural,
    Singular,
    Version,
    Help
};

/// Maps a command word to its Command; std::nullopt for unknown words.
std::optional<Command> parseCommand(const std::string& word);

/**
 * @brief Parses a decimal count argument.
 *
 * The whole string must be consumed: "2x", "", " " and values that do not fit
 * in a long yield std::nullopt. A leading sign is accepted.
 */
std::optional<long> parseCount(const std::string& text);
