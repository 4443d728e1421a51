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
 *  \file references.hpp
 *  \brief Discovery of the references a Message or Term depends on
 */

#ifndef FLUENTSTORE_REFERENCES_HPP_INCLUDED
#define FLUENTSTORE_REFERENCES_HPP_INCLUDED

#include "fluentstore/ast.hpp"
#include <set>
#include <string>

namespace fluentstore {

/**
 * \brief Collects the references used in the value of a Message or Term
 *
 * References are returned as they would be written in a placeable:
 * - ``message`` or ``message.attribute``
 * - ``-term``, without any attribute or arguments
 * - ``$variable``, only if ``isTerm`` is false. Variables used by a Term are
 *   provided by the messages which reference it.
 *
 * Attribute values and the selectors of select expressions are not searched.
 */
std::set<std::string> collectReferences(const ast::Message &entry, bool isTerm);

} // namespace fluentstore

#endif // FLUENTSTORE_REFERENCES_HPP_INCLUDED
