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
 *  \file unit.hpp
 *  \brief A single translatable entry, or comment, of a fluent resource
 */

#ifndef FLUENTSTORE_UNIT_HPP_INCLUDED
#define FLUENTSTORE_UNIT_HPP_INCLUDED

#include "fluentstore/serializer.hpp"
#include "fluentstore/types.hpp"
#include <optional>
#include <set>
#include <string>

namespace fluentstore {

/**
 * \class FluentUnit
 * \brief A Message, Term or standalone Comment
 *
 * Fluent resources are monolingual, so the source and target of a unit are the
 * same string. The source of a Message or Term holds its value followed by its
 * attributes, one ``.attr = value`` per line, with no indentation:
 *
 * \code
 * Opens a new window
 * .title = New Window
 * .accesskey = N
 * \endcode
 *
 * The source is free text and is only parsed when it is needed (placeholders,
 * structured access and serialization), so it may be invalid between edits.
 *
 * Comment units have no id and no source. Their text is stored as the unit's notes.
 */
class FluentUnit {
    std::string source;
    std::string id;
    std::string comment;
    // Set when the unit has a comment, even an empty one
    bool commented;
    FluentType type;

  public:
    /**
     * \param type: If not given, ids starting with ``-`` are Terms and all other
     *              ids are Messages.
     * \throws InvalidIdError if id is not empty and is not valid for the type
     */
    explicit FluentUnit(const std::string &source = "", const std::string &id = "",
                        const std::string &comment = "",
                        std::optional<FluentType> type = std::nullopt);

    const std::string &getId() const { return this->id; }
    /// \throws InvalidIdError, leaving the unit unchanged
    void setId(const std::string &id);

    const std::string &getSource() const { return this->source; }
    void setSource(const std::string &source) { this->source = source; }
    const std::string &getTarget() const { return this->source; }
    void setTarget(const std::string &target) { this->source = target; }

    const std::string &getNotes() const { return this->comment; }
    /// True if the unit has a comment. A bare ``#`` line is a comment with empty notes.
    bool hasNotes() const { return this->commented; }
    /// Appends a line to the unit's comment
    void addNote(const std::string &text);
    void removeNotes() {
        this->comment.clear();
        this->commented = false;
    }

    FluentType getType() const { return this->type; }
    bool isHeader() const { return isCommentType(this->type); }
    bool isTranslatable() const { return !isCommentType(this->type); }
    /// True for Messages and Terms whose source is blank. Such units are not serialized.
    bool isEmpty() const;

    /**
     * \brief References used by the unit's value
     *
     * Returns an empty set if the source cannot be parsed.
     */
    std::set<std::string> getPlaceholders() const;

    /// \throws SourceSyntaxError if the source cannot be parsed
    std::optional<std::string> getValue() const;
    /// \throws SourceSyntaxError if the source cannot be parsed
    AttributeList getAttributes() const;
    /// Replaces the source with the given value and attributes
    void setValue(const std::optional<std::string> &value,
                  const AttributeList &attributes = AttributeList());
};

} // namespace fluentstore

#endif // FLUENTSTORE_UNIT_HPP_INCLUDED
