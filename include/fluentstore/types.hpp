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
 *  \file types.hpp
 *  \brief Kinds of units stored in a FluentFile
 */

#ifndef FLUENTSTORE_TYPES_HPP_INCLUDED
#define FLUENTSTORE_TYPES_HPP_INCLUDED

#include <optional>
#include <string>

namespace fluentstore {

enum class FluentType { Message, Term, ResourceComment, GroupComment, DetachedComment };

/// The name of the type, e.g. "GroupComment"
std::string toString(FluentType type);
std::optional<FluentType> fluentTypeFromString(const std::string &name);

inline bool isCommentType(FluentType type) {
    return type == FluentType::ResourceComment || type == FluentType::GroupComment ||
           type == FluentType::DetachedComment;
}

} // namespace fluentstore

#endif // FLUENTSTORE_TYPES_HPP_INCLUDED
