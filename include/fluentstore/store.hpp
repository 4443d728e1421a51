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
 *  \file store.hpp
 *  \brief A fluent resource as an ordered list of editable units
 */

#ifndef FLUENTSTORE_STORE_HPP_INCLUDED
#define FLUENTSTORE_STORE_HPP_INCLUDED

#include "fluentstore/ast.hpp"
#include "fluentstore/unit.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fluentstore {

/**
 * \class FluentFile
 * \brief Storage for the units of a single fluent resource
 *
 * Each Message and Term becomes one FluentUnit, with its attributes folded into
 * the unit's source. Standalone comments become comment units, so that they are
 * kept in place when the resource is written back.
 */
class FluentFile {
  private:
    std::vector<FluentUnit> unitList;
    std::optional<std::filesystem::path> filename;

    static std::vector<FluentUnit> toUnits(std::vector<ast::Entry> &&entries);

  public:
    FluentFile() = default;

    /**
     * \brief Parses a resource from its contents
     * \throws ParseError if the resource contains any syntax errors
     */
    explicit FluentFile(const std::string &contents);

    /**
     * \brief Loads a resource file, and remembers its filename
     * \throws ParseError if the resource contains any syntax errors
     */
    static FluentFile fromFile(const std::filesystem::path &filePath);

    /**
     *  \brief Replaces the units of this file with those parsed from contents
     *
     *  If parsing fails, the existing units are kept.
     */
    void parse(const std::string &contents);

    const std::vector<FluentUnit> &units() const { return this->unitList; }
    std::vector<FluentUnit> &units() { return this->unitList; }

    void addUnit(FluentUnit &&unit) { this->unitList.push_back(std::move(unit)); }

    /// Returns the Message or Term with the given id, or nullptr if there is none
    FluentUnit *findUnit(const std::string &id);
    const FluentUnit *findUnit(const std::string &id) const;

    /**
     * \brief Writes all units in canonical fluent syntax
     *
     * Empty Messages and Terms are skipped. Standalone comments are followed by
     * a blank line, and preceded by one unless they are the first entry.
     *
     * \throws SourceSyntaxError for the first unit with invalid source. Nothing
     *         is produced in this case.
     */
    std::string serialize() const;

    /// Serializes to the given path. The file is not touched if serialization fails.
    void save(const std::filesystem::path &filePath) const;

    const std::optional<std::filesystem::path> &getFilename() const { return this->filename; }
    void setFilename(const std::filesystem::path &filePath) { this->filename = filePath; }
};

} // namespace fluentstore

#endif // FLUENTSTORE_STORE_HPP_INCLUDED
