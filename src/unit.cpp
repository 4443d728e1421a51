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

#include "fluentstore/unit.hpp"
#include "fluentstore/errors.hpp"
#include "fluentstore/identifier.hpp"
#include "fluentstore/references.hpp"

namespace fluentstore {

std::string toString(FluentType type) {
    switch (type) {
        case FluentType::Message:
            return "Message";
        case FluentType::Term:
            return "Term";
        case FluentType::ResourceComment:
            return "ResourceComment";
        case FluentType::GroupComment:
            return "GroupComment";
        case FluentType::DetachedComment:
            return "DetachedComment";
    }
    return "Unknown";
}

std::optional<FluentType> fluentTypeFromString(const std::string &name) {
    for (FluentType type : {FluentType::Message, FluentType::Term, FluentType::ResourceComment,
                            FluentType::GroupComment, FluentType::DetachedComment}) {
        if (toString(type) == name)
            return type;
    }
    return std::nullopt;
}

namespace {
    FluentType inferType(const std::string &id) {
        if (!id.empty() && id.front() == '-')
            return FluentType::Term;
        return FluentType::Message;
    }
} // namespace

FluentUnit::FluentUnit(const std::string &source, const std::string &id,
                       const std::string &comment, std::optional<FluentType> type)
    : source(source), id(id), comment(comment), commented(!comment.empty()),
      type(type ? *type : inferType(id)) {
    if (!id.empty())
        validateId(this->type, id);
}

void FluentUnit::setId(const std::string &id) {
    validateId(this->type, id);
    this->id = id;
}

void FluentUnit::addNote(const std::string &text) {
    if (this->commented)
        this->comment += "\n";
    this->comment += text;
    this->commented = true;
}

bool FluentUnit::isEmpty() const {
    if (this->isHeader())
        return false;
    return this->source.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::set<std::string> FluentUnit::getPlaceholders() const {
    if (this->isHeader() || this->isEmpty())
        return {};
    try {
        ast::Message entry = parseUnitSource(this->id, this->type, this->source);
        return collectReferences(entry, this->type == FluentType::Term);
    } catch (const SourceSyntaxError &) {
        // Placeholders of invalid source are unknown until the source is fixed
        return {};
    }
}

std::optional<std::string> FluentUnit::getValue() const {
    if (this->isHeader() || this->isEmpty())
        return std::nullopt;
    return splitSource(parseUnitSource(this->id, this->type, this->source)).first;
}

AttributeList FluentUnit::getAttributes() const {
    if (this->isHeader() || this->isEmpty())
        return AttributeList();
    return splitSource(parseUnitSource(this->id, this->type, this->source)).second;
}

void FluentUnit::setValue(const std::optional<std::string> &value,
                          const AttributeList &attributes) {
    this->source = flattenSource(value, attributes);
}

} // namespace fluentstore
