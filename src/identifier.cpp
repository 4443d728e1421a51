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

#include "fluentstore/identifier.hpp"
#include "fluentstore/errors.hpp"
#include <lexy/action/match.hpp>
#include <lexy/dsl.hpp>
#include <lexy/input/string_input.hpp>

namespace fluentstore {
    namespace grammar {
        namespace dsl = lexy::dsl;

        // Identifier          ::= [a-zA-Z] [a-zA-Z0-9_-]*
        static constexpr auto identifier = [] {
            auto head = dsl::ascii::alpha;
            auto tail = dsl::ascii::alpha_digit_underscore / dsl::lit_c<'-'>;
            return dsl::identifier(head, tail);
        }();

        struct MessageIdentifier {
            static constexpr auto rule = identifier + dsl::eof;
        };

        struct TermIdentifier {
            static constexpr auto rule = dsl::lit_c<'-'> + identifier + dsl::eof;
        };

        // Callee of a FunctionReference
        struct FunctionName {
            static constexpr auto rule = [] {
                auto head = dsl::ascii::upper;
                auto tail = dsl::ascii::upper / dsl::ascii::digit / dsl::lit_c<'_'> / dsl::lit_c<'-'>;
                return dsl::identifier(head, tail) + dsl::eof;
            }();
        };
    } // namespace grammar

    bool isValidId(FluentType type, const std::string &id) {
        auto input = lexy::string_input<lexy::utf8_encoding>(id);
        switch (type) {
            case FluentType::Message:
                return lexy::match<grammar::MessageIdentifier>(input);
            case FluentType::Term:
                return lexy::match<grammar::TermIdentifier>(input);
            case FluentType::ResourceComment:
            case FluentType::GroupComment:
            case FluentType::DetachedComment:
                return id.empty();
        }
        return false;
    }

    void validateId(FluentType type, const std::string &id) {
        if (!isValidId(type, id)) {
            throw InvalidIdError("Invalid id \"" + id + "\" for " + toString(type));
        }
    }

    bool isValidFunctionName(const std::string &name) {
        return lexy::match<grammar::FunctionName>(lexy::string_input<lexy::utf8_encoding>(name));
    }

} // namespace fluentstore
