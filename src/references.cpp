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

#include "fluentstore/references.hpp"

namespace fluentstore {
    template <class> inline constexpr bool always_false_v = false;

    namespace {
        void collectPattern(const ast::Pattern &pattern, bool isTerm,
                            std::set<std::string> &references);

        void collectExpression(const ast::Expression &expression, bool isTerm,
                               std::set<std::string> &references) {
            std::visit(
                [&](const auto &arg) {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, ast::StringLiteral> ||
                                  std::is_same_v<T, ast::NumberLiteral>) {
                        // Literals are not references
                    } else if constexpr (std::is_same_v<T, ast::VariableReference>) {
                        if (!isTerm)
                            references.insert("$" + arg.identifier);
                    } else if constexpr (std::is_same_v<T, ast::MessageReference>) {
                        if (arg.attribute)
                            references.insert(arg.identifier + "." + *arg.attribute);
                        else
                            references.insert(arg.identifier);
                    } else if constexpr (std::is_same_v<T, ast::TermReference>) {
                        references.insert("-" + arg.identifier);
                    } else if constexpr (std::is_same_v<T, ast::FunctionReference>) {
                        for (const ast::Expression &argument : arg.arguments.positional)
                            collectExpression(argument, isTerm, references);
                    } else if constexpr (std::is_same_v<T, ast::Placeable>) {
                        collectExpression(arg.get(), isTerm, references);
                    } else if constexpr (std::is_same_v<T, ast::SelectExpression>) {
                        for (const ast::Variant &variant : arg.variants)
                            collectPattern(variant.value, isTerm, references);
                    } else
                        static_assert(always_false_v<T>, "non-exhaustive visitor!");
                },
                expression.value);
        }

        void collectPattern(const ast::Pattern &pattern, bool isTerm,
                            std::set<std::string> &references) {
            for (const ast::PatternElement &element : pattern.elements) {
                if (auto *placeable = std::get_if<ast::Placeable>(&element))
                    collectExpression(placeable->get(), isTerm, references);
            }
        }
    } // namespace

    std::set<std::string> collectReferences(const ast::Message &entry, bool isTerm) {
        std::set<std::string> references;
        if (entry.getPattern())
            collectPattern(*entry.getPattern(), isTerm, references);
        return references;
    }

} // namespace fluentstore
