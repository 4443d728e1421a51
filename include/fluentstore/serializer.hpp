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
 *  \file serializer.hpp
 *  \brief Conversion of the AST back into fluent source
 *
 *  There are two textual forms of an entry:
 *
 *  - The canonical form written to ``.ftl`` files, where every continuation line
 *    is indented by four spaces per level of nesting.
 *  - The flattened form stored as the source of a FluentUnit. Values are not
 *    indented, and attributes follow the value as ``.attr = value`` lines.
 */

#ifndef FLUENTSTORE_SERIALIZER_HPP_INCLUDED
#define FLUENTSTORE_SERIALIZER_HPP_INCLUDED

#include "fluentstore/ast.hpp"
#include "fluentstore/types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fluentstore {

class FluentUnit;

/// Attribute identifiers paired with their flattened values, in source order
typedef std::vector<std::pair<std::string, std::string>> AttributeList;

std::string serializeExpression(const ast::Expression &expression);
std::string serializePlaceable(const ast::Placeable &placeable);

/**
 * \brief Serializes a pattern as it follows the ``=`` of an entry or attribute
 *
 * The result starts with a space if the pattern stays on the same line, or with a
 * newline if it is multiline.
 */
std::string serializePattern(const ast::Pattern &pattern);

/// Writes each line of a comment prefixed with the marker of its kind
std::string serializeComment(const ast::AnyComment &comment);

/**
 * \brief Serializes a Message or Term, including its attached comment
 *
 * \param isTerm: If true, the identifier is written with its ``-`` prefix
 */
std::string serializeMessage(const ast::Message &message, bool isTerm);

/// Junk is written back unchanged
std::string serializeEntry(const ast::Entry &entry);

/**
 * \brief Builds the flattened source of a unit from a Message or Term
 *
 * Values beginning with ``.``, ``*`` or ``[`` have that character escaped as a
 * string literal, as they would otherwise be read as syntax at the start of a line.
 */
std::string renderSource(const ast::Message &message);

/// Inverse of splitSource: joins a value and attributes into flattened source
std::string flattenSource(const std::optional<std::string> &value,
                          const AttributeList &attributes);

/**
 * \brief Parses the flattened source of a unit
 *
 * \param id: The unit's id. Term ids include the ``-``.
 * \throws SourceSyntaxError if the source is not a valid value for the unit.
 *         Positions in the error are relative to ``source``.
 */
ast::Message parseUnitSource(const std::string &id, FluentType type, const std::string &source);

/// Splits a parsed unit into its flattened value and attributes
std::pair<std::optional<std::string>, AttributeList> splitSource(const ast::Message &message);

/**
 * \brief Renders a unit in canonical form
 *
 * Returns an empty string for Messages and Terms without any source.
 * Comment units are written without the blank lines which separate them from
 * other entries.
 */
std::string renderUnit(const FluentUnit &unit);

} // namespace fluentstore

#endif // FLUENTSTORE_SERIALIZER_HPP_INCLUDED
