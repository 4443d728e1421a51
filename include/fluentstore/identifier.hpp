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
 *  \file identifier.hpp
 *  \brief Lexical rules for Message, Term and Function identifiers
 */

#ifndef FLUENTSTORE_IDENTIFIER_HPP_INCLUDED
#define FLUENTSTORE_IDENTIFIER_HPP_INCLUDED

#include "fluentstore/types.hpp"
#include <string>

namespace fluentstore {

/**
 * \brief Checks an identifier against the rules for the given unit type
 *
 * - Messages: ``[A-Za-z][A-Za-z0-9_-]*``
 * - Terms: ``-`` followed by a Message identifier
 * - Comments have no identifier, so only the empty string is valid
 */
bool isValidId(FluentType type, const std::string &id);

/**
 * \brief As isValidId, but throws InvalidIdError if the identifier is not valid
 */
void validateId(FluentType type, const std::string &id);

/// Function names must be upper case, e.g. ``NUMBER`` or ``DATE-TIME``
bool isValidFunctionName(const std::string &name);

} // namespace fluentstore

#endif // FLUENTSTORE_IDENTIFIER_HPP_INCLUDED
