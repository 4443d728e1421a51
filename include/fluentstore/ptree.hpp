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
 *  \file ptree.hpp
 *  \brief Conversion of the AST into a property tree, for dumping as JSON
 *
 *  The layout follows the JSON produced by the reference fluent tooling, with
 *  null values stored as the string ``null`` and empty lists as empty strings.
 */

#ifndef FLUENTSTORE_PTREE_HPP_INCLUDED
#define FLUENTSTORE_PTREE_HPP_INCLUDED

#include "fluentstore/ast.hpp"
#include <boost/property_tree/ptree.hpp>
#include <vector>

namespace fluentstore {

boost::property_tree::ptree getPropertyTree(const ast::Expression &expression);
boost::property_tree::ptree getPropertyTree(const ast::Pattern &pattern);

/// Appends the tree for entry to the list parent
void processEntry(boost::property_tree::ptree &parent, const ast::Entry &entry);

/// The tree of a whole resource, with type ``Resource``
boost::property_tree::ptree getResourceTree(const std::vector<ast::Entry> &entries);

} // namespace fluentstore

#endif // FLUENTSTORE_PTREE_HPP_INCLUDED
