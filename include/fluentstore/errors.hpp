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
 *  \file errors.hpp
 *  \brief Exceptions raised while parsing, validating and serializing resources
 */

#ifndef FLUENTSTORE_ERRORS_HPP_INCLUDED
#define FLUENTSTORE_ERRORS_HPP_INCLUDED

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fluentstore {

/**
 * \brief Returns the human readable message for a grammar diagnostic code
 *
 * \param code: The diagnostic code, e.g. ``E0010``
 * \param args: Arguments substituted into the message, in order
 */
std::string describeError(const std::string &code, const std::vector<std::string> &args);

/// 1-based line and column of a byte offset. Columns count code points.
std::pair<size_t, size_t> lineColumn(const std::string &source, size_t offset);

/**
 * \class FluentError
 * \brief Base class of all errors raised by fluent-store
 */
class FluentError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * \class Diagnostic
 * \brief A single grammar error found while parsing a resource
 */
struct Diagnostic {
    std::string code;
    std::string message;
    /// Byte offset of the error in the parsed source
    size_t offset = 0;
    size_t line = 1;
    size_t column = 1;
    /// The Junk text the error was found in
    std::string snippet;
};

/**
 * \class ParseError
 * \brief Raised when a resource contains Junk.
 *
 * All problems in the resource are reported at once, one line per Junk entry.
 */
class ParseError : public FluentError {
    std::vector<Diagnostic> problems;

  public:
    explicit ParseError(std::vector<Diagnostic> &&diagnostics);

    const std::vector<Diagnostic> &diagnostics() const { return this->problems; }
};

/**
 * \class SourceSyntaxError
 * \brief Raised when the source of a FluentUnit is not valid Fluent
 *
 * The line and column are relative to the unit's source text.
 */
class SourceSyntaxError : public FluentError {
    std::string id;
    std::string errorCode;
    size_t errorLine;
    size_t errorColumn;

  public:
    SourceSyntaxError(const std::string &unitId, const std::string &code,
                      const std::string &detail, size_t line, size_t column);

    const std::string &unitId() const { return this->id; }
    const std::string &code() const { return this->errorCode; }
    size_t line() const { return this->errorLine; }
    size_t column() const { return this->errorColumn; }
};

/**
 * \class InvalidIdError
 * \brief Raised when an identifier does not match the rules for its unit type
 */
class InvalidIdError : public FluentError {
  public:
    using FluentError::FluentError;
};

} // namespace fluentstore

#endif // FLUENTSTORE_ERRORS_HPP_INCLUDED
