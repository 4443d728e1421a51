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

#include "fluentstore/errors.hpp"
#include <map>
#include <sstream>
#include <unicode/utf8.h>

namespace fluentstore {
    namespace {
        const std::map<std::string, std::string> MESSAGES = {
            {"E0001", "Generic error"},
            {"E0002", "Expected an entry start"},
            {"E0003", "Expected token: \"{0}\""},
            {"E0004", "Expected a character from range: \"{0}\""},
            {"E0005", "Expected message \"{0}\" to have a value or attributes"},
            {"E0006", "Expected term \"-{0}\" to have a value"},
            {"E0008", "The callee has to be an upper-case identifier or a term"},
            {"E0009", "The argument name has to be a simple identifier"},
            {"E0010", "Expected one of the variants to be marked as default (*)"},
            {"E0011", "Expected at least one variant after \"->\""},
            {"E0012", "Expected value"},
            {"E0013", "Expected variant key"},
            {"E0014", "Expected literal"},
            {"E0015", "Only one variant can be marked as default (*)"},
            {"E0016", "Message references cannot be used as selectors"},
            {"E0017", "Terms cannot be used as selectors"},
            {"E0018", "Attributes of messages cannot be used as selectors"},
            {"E0019", "Attributes of terms cannot be used as placeables"},
            {"E0020", "Unterminated string expression"},
            {"E0021", "Positional arguments must not follow named arguments"},
            {"E0022", "Named arguments must be unique"},
            {"E0025", "Unknown escape sequence: \\{0}."},
            {"E0026", "Invalid Unicode escape sequence: {0}."},
            {"E0027", "Unbalanced closing brace in TextElement."},
            {"E0028", "Expected an inline expression"},
            {"E0029", "Expected simple expression as selector"},
        };

        const size_t SNIPPET_LENGTH = 80;

        // Junk text on a single line, cut to SNIPPET_LENGTH code points
        std::string formatSnippet(const std::string &junk) {
            size_t start = junk.find_first_not_of(" \t\r\n");
            if (start == std::string::npos)
                return "";
            size_t end = junk.find_last_not_of(" \t\r\n");
            std::string stripped = junk.substr(start, end - start + 1);

            std::string snippet;
            size_t length = 0;
            const char *text = stripped.data();
            int32_t size = static_cast<int32_t>(stripped.size());
            int32_t position = 0;
            while (position < size) {
                if (length == SNIPPET_LENGTH)
                    return snippet + "\xE2\x80\xA6";
                int32_t previous = position;
                UChar32 codePoint;
                U8_NEXT(text, position, size, codePoint);
                if (codePoint == '\n') {
                    snippet += "\\n";
                } else if (codePoint != '\r') {
                    snippet.append(stripped, previous, position - previous);
                }
                length++;
            }
            return snippet;
        }
    } // namespace

    std::string describeError(const std::string &code, const std::vector<std::string> &args) {
        auto found = MESSAGES.find(code);
        if (found == MESSAGES.end())
            return "Unknown error " + code;

        std::string message = found->second;
        for (size_t i = 0; i < args.size(); i++) {
            std::string marker = "{" + std::to_string(i) + "}";
            size_t position = message.find(marker);
            if (position != std::string::npos)
                message.replace(position, marker.size(), args[i]);
        }
        return message;
    }

    std::pair<size_t, size_t> lineColumn(const std::string &source, size_t offset) {
        if (offset > source.size())
            offset = source.size();

        size_t line = 1;
        size_t lineStart = 0;
        for (size_t i = 0; i < offset; i++) {
            if (source[i] == '\n') {
                line++;
                lineStart = i + 1;
            }
        }

        const char *text = source.data();
        int32_t position = static_cast<int32_t>(lineStart);
        int32_t end = static_cast<int32_t>(offset);
        size_t column = 1;
        while (position < end) {
            UChar32 codePoint;
            U8_NEXT(text, position, end, codePoint);
            (void)codePoint;
            column++;
        }
        return std::make_pair(line, column);
    }

    namespace {
        std::string parseErrorMessage(const std::vector<Diagnostic> &diagnostics) {
            std::stringstream ss;
            ss << "Parsing error for fluent source: ";
            if (!diagnostics.empty())
                ss << formatSnippet(diagnostics.front().snippet);
            for (const Diagnostic &diagnostic : diagnostics)
                ss << "\n" << diagnostic.code << ": " << diagnostic.message;
            return ss.str();
        }

        std::string sourceErrorMessage(const std::string &unitId, const std::string &code,
                                       const std::string &detail, size_t line, size_t column) {
            std::stringstream ss;
            ss << "Error in source of FluentUnit \"" << unitId << "\":\n"
               << code << ": " << detail << " [line " << line << ", column " << column << "]";
            return ss.str();
        }
    } // namespace

    ParseError::ParseError(std::vector<Diagnostic> &&diagnostics)
        : FluentError(parseErrorMessage(diagnostics)), problems(std::move(diagnostics)) {}

    SourceSyntaxError::SourceSyntaxError(const std::string &unitId, const std::string &code,
                                         const std::string &detail, size_t line, size_t column)
        : FluentError(sourceErrorMessage(unitId, code, detail, line, column)), id(unitId),
          errorCode(code), errorLine(line), errorColumn(column) {}

} // namespace fluentstore
