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

#include "fluentstore/store.hpp"
#include "fluentstore/errors.hpp"
#include "fluentstore/parser.hpp"
#include "fluentstore/serializer.hpp"
#include <fstream>

using std::string;
using std::filesystem::path;

namespace fluentstore {
template <class> inline constexpr bool always_false_v = false;

FluentFile::FluentFile(const string &contents) { this->parse(contents); }

FluentFile FluentFile::fromFile(const path &filePath) {
    FluentFile file;
    file.unitList = toUnits(parseFile(filePath, true));
    file.filename = filePath;
    return file;
}

void FluentFile::parse(const string &contents) {
    this->unitList = toUnits(fluentstore::parse(contents, true));
}

std::vector<FluentUnit> FluentFile::toUnits(std::vector<ast::Entry> &&entries) {
    std::vector<FluentUnit> units;
    for (ast::Entry &entry : entries) {
        std::visit(
            [&units](auto &&arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, ast::Message> || std::is_same_v<T, ast::Term>) {
                    constexpr bool isTerm = std::is_same_v<T, ast::Term>;
                    string comment;
                    if (arg.getComment())
                        comment = arg.getComment()->getValue();
                    string id = isTerm ? "-" + arg.getId() : arg.getId();
                    units.emplace_back(renderSource(arg), id, comment,
                                       isTerm ? FluentType::Term : FluentType::Message);
                    if (arg.getComment() && comment.empty())
                        units.back().addNote("");
                } else if constexpr (std::is_same_v<T, ast::AnyComment>) {
                    std::visit(
                        [&units](const auto &comment) {
                            using C = std::decay_t<decltype(comment)>;
                            FluentType type = FluentType::DetachedComment;
                            if constexpr (std::is_same_v<C, ast::Comment>)
                                type = FluentType::DetachedComment;
                            else if constexpr (std::is_same_v<C, ast::GroupComment>)
                                type = FluentType::GroupComment;
                            else if constexpr (std::is_same_v<C, ast::ResourceComment>)
                                type = FluentType::ResourceComment;
                            else
                                static_assert(always_false_v<C>, "non-exhaustive visitor!");
                            units.emplace_back("", "", comment.getValue(), type);
                        },
                        arg);
                } else if constexpr (std::is_same_v<T, ast::Junk>) {
                    // Strict parsing has already reported Junk
                } else {
                    static_assert(always_false_v<T>, "non-exhaustive visitor!");
                }
            },
            entry);
    }
    return units;
}

FluentUnit *FluentFile::findUnit(const string &id) {
    for (FluentUnit &unit : this->unitList) {
        if (unit.isTranslatable() && unit.getId() == id)
            return &unit;
    }
    return nullptr;
}

const FluentUnit *FluentFile::findUnit(const string &id) const {
    for (const FluentUnit &unit : this->unitList) {
        if (unit.isTranslatable() && unit.getId() == id)
            return &unit;
    }
    return nullptr;
}

string FluentFile::serialize() const {
    string output;
    bool hasEntries = false;
    for (const FluentUnit &unit : this->unitList) {
        string text = renderUnit(unit);
        if (text.empty())
            continue;
        if (unit.isHeader()) {
            if (hasEntries)
                output += "\n";
            output += text + "\n";
        } else {
            output += text;
        }
        hasEntries = true;
    }
    return output;
}

void FluentFile::save(const path &filePath) const {
    string contents = this->serialize();
    std::ofstream ofs(filePath, std::ios::binary);
    if (!ofs)
        throw FluentError("Unable to write fluent resource " + filePath.string());
    ofs << contents;
    if (!ofs)
        throw FluentError("Failed to write fluent resource " + filePath.string());
}

} // namespace fluentstore
