/*
 *  This file is part of fluent-store.
 *
 *  Copyright (C) 2021 Benjamin Winger
 *
 *  fluent-store is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  fluent-store is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with fluent-store.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef FLUENTSTORE_GRAMMAR_ERROR_HPP_INCLUDED
#define FLUENTSTORE_GRAMMAR_ERROR_HPP_INCLUDED

#include <string>
#include <utility>
#include <vector>

namespace fluentstore {

/**
 * An entry which could not be parsed.
 *
 * Reported by the lexy error callback for syntax errors, and thrown from
 * value callbacks for errors which need the parsed values to be detected.
 * It never leaves the parser: the resource loop turns it into Junk.
 */
struct GrammarError {
    std::string code;
    std::vector<std::string> arguments;
    /// Where in the source the error was found
    const char *position;

    GrammarError(std::string code, std::vector<std::string> arguments, const char *position)
        : code(std::move(code)), arguments(std::move(arguments)), position(position) {}
};

} // namespace fluentstore

#endif // FLUENTSTORE_GRAMMAR_ERROR_HPP_INCLUDED
