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

/**
 *  \file parser.hpp
 *  \brief Parsing of fluent resources from raw data
 */

#ifndef FLUENTSTORE_PARSER_HPP_INCLUDED
#define FLUENTSTORE_PARSER_HPP_INCLUDED

#include "fluentstore/ast.hpp"
#include "fluentstore/errors.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fluentstore {
    /**
     * \brief Parses a fluent resource
     *
     * \param contents: UTF-8 encoded fluent source
     * \param strict: If true, a ParseError listing every problem is thrown if the
     *                resource contains Junk. Otherwise Junk is returned as entries.
     */
    std::vector<ast::Entry> parse(const std::string &contents, bool strict = false);
    std::vector<ast::Entry> parseFile(const std::filesystem::path &file, bool strict = false);

    /// Parses a fluent resource, throwing ParseError if it contains any Junk
    inline std::vector<ast::Entry> parseResource(const std::string &contents) {
        return parse(contents, true);
    }

    /// Builds the error reported for a resource containing the given Junk
    ParseError makeParseError(const std::string &contents, const std::vector<ast::Junk> &junk);
} // namespace fluentstore

#endif
