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

#include "fluentstore/serializer.hpp"
#include "fluentstore/errors.hpp"
#include "fluentstore/parser.hpp"
#include "fluentstore/unit.hpp"
#include <sstream>

namespace fluentstore {
    template <class> inline constexpr bool always_false_v = false;

    namespace {
        const std::string INDENT = "    ";

        std::vector<std::string> splitLines(const std::string &text) {
            std::vector<std::string> lines;
            size_t start = 0;
            while (true) {
                size_t end = text.find('\n', start);
                if (end == std::string::npos) {
                    lines.push_back(text.substr(start));
                    return lines;
                }
                lines.push_back(text.substr(start, end - start));
                start = end + 1;
            }
        }

        // Blank lines are left empty, rather than being filled with the indent
        std::string indentExceptFirstLine(const std::string &content) {
            std::string result;
            for (size_t i = 0; i < content.size(); i++) {
                result += content[i];
                if (content[i] == '\n' && i + 1 < content.size() && content[i + 1] != '\n')
                    result += INDENT;
            }
            return result;
        }

        std::string serializeCallArguments(const ast::CallArguments &arguments) {
            std::stringstream ss;
            ss << "(";
            bool first = true;
            for (const ast::Expression &argument : arguments.positional) {
                if (!first)
                    ss << ", ";
                ss << serializeExpression(argument);
                first = false;
            }
            for (const ast::NamedArgument &argument : arguments.named) {
                if (!first)
                    ss << ", ";
                ss << argument.name << ": "
                   << std::visit([](const auto &literal) { return serializeExpression(literal); },
                                 argument.value);
                first = false;
            }
            ss << ")";
            return ss.str();
        }

        std::string serializeVariantKey(const ast::VariantKey &key) {
            return std::visit(
                [](const auto &arg) -> std::string {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, std::string>)
                        return arg;
                    else if constexpr (std::is_same_v<T, ast::NumberLiteral>)
                        return arg.value;
                    else
                        static_assert(always_false_v<T>, "non-exhaustive visitor!");
                },
                key);
        }

        std::string serializeVariant(const ast::Variant &variant) {
            std::string value = indentExceptFirstLine(serializePattern(variant.value));
            std::string key = serializeVariantKey(variant.key);
            if (variant.isDefault)
                return "\n   *[" + key + "]" + value;
            return "\n    [" + key + "]" + value;
        }

        bool isSelectPlaceable(const ast::PatternElement &element) {
            if (auto *placeable = std::get_if<ast::Placeable>(&element))
                return std::holds_alternative<ast::SelectExpression>(placeable->get().value);
            return false;
        }

        bool startsOnNewLine(const ast::Pattern &pattern) {
            bool isMultiline = false;
            for (const ast::PatternElement &element : pattern.elements) {
                if (isSelectPlaceable(element)) {
                    isMultiline = true;
                } else if (auto *text = std::get_if<std::string>(&element)) {
                    if (text->find('\n') != std::string::npos)
                        isMultiline = true;
                }
            }
            if (!isMultiline)
                return false;

            // Text beginning with a special character can only be kept on the first line
            if (auto *text = std::get_if<std::string>(&pattern.elements.front())) {
                char first = text->empty() ? '\0' : text->front();
                if (first == '[' || first == '.' || first == '*')
                    return false;
            }
            return true;
        }

        std::string serializeElements(const ast::Pattern &pattern) {
            std::string content;
            for (const ast::PatternElement &element : pattern.elements) {
                if (auto *text = std::get_if<std::string>(&element))
                    content += *text;
                else
                    content += serializePlaceable(std::get<ast::Placeable>(element));
            }
            return content;
        }

        // Unindented pattern text, with special characters at the start escaped
        std::string flattenPattern(const ast::Pattern &pattern) {
            std::string content = serializeElements(pattern);
            if (!pattern.elements.empty() &&
                std::holds_alternative<std::string>(pattern.elements.front()) &&
                !content.empty()) {
                char first = content.front();
                if (first == '.' || first == '*' || first == '[')
                    return "{ \"" + std::string(1, first) + "\" }" + content.substr(1);
            }
            return content;
        }

        // The source is wrapped as the indented value of an entry, so positions
        // have to be moved up one line and four columns to the left.
        std::pair<size_t, size_t> toSourcePosition(size_t line, size_t column) {
            if (line <= 1)
                return std::make_pair(1, 1);
            return std::make_pair(line - 1, column > INDENT.size() ? column - INDENT.size() : 1);
        }
    } // namespace

    std::string serializePlaceable(const ast::Placeable &placeable) {
        const ast::Expression &expression = placeable.get();
        if (auto *inner = std::get_if<ast::Placeable>(&expression.value))
            return "{" + serializePlaceable(*inner) + "}";
        if (std::holds_alternative<ast::SelectExpression>(expression.value))
            return "{ " + serializeExpression(expression) + "}";
        return "{ " + serializeExpression(expression) + " }";
    }

    std::string serializeExpression(const ast::Expression &expression) {
        return std::visit(
            [](const auto &arg) -> std::string {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, ast::StringLiteral>) {
                    return "\"" + arg.value + "\"";
                } else if constexpr (std::is_same_v<T, ast::NumberLiteral>) {
                    return arg.value;
                } else if constexpr (std::is_same_v<T, ast::VariableReference>) {
                    return "$" + arg.identifier;
                } else if constexpr (std::is_same_v<T, ast::MessageReference>) {
                    if (arg.attribute)
                        return arg.identifier + "." + *arg.attribute;
                    return arg.identifier;
                } else if constexpr (std::is_same_v<T, ast::TermReference>) {
                    std::string out = "-" + arg.identifier;
                    if (arg.attribute)
                        out += "." + *arg.attribute;
                    if (arg.arguments)
                        out += serializeCallArguments(*arg.arguments);
                    return out;
                } else if constexpr (std::is_same_v<T, ast::FunctionReference>) {
                    return arg.identifier + serializeCallArguments(arg.arguments);
                } else if constexpr (std::is_same_v<T, ast::Placeable>) {
                    return serializePlaceable(arg);
                } else if constexpr (std::is_same_v<T, ast::SelectExpression>) {
                    std::string out = serializeExpression(arg.getSelector()) + " ->";
                    for (const ast::Variant &variant : arg.variants)
                        out += serializeVariant(variant);
                    return out + "\n";
                } else
                    static_assert(always_false_v<T>, "non-exhaustive visitor!");
            },
            expression.value);
    }

    std::string serializePattern(const ast::Pattern &pattern) {
        std::string content = indentExceptFirstLine(serializeElements(pattern));
        if (!pattern.elements.empty() && startsOnNewLine(pattern))
            return "\n" + INDENT + content;
        return " " + content;
    }

    std::string serializeComment(const ast::AnyComment &comment) {
        std::string prefix = std::visit(
            [](const auto &arg) -> std::string {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, ast::Comment>)
                    return "#";
                else if constexpr (std::is_same_v<T, ast::GroupComment>)
                    return "##";
                else if constexpr (std::is_same_v<T, ast::ResourceComment>)
                    return "###";
                else
                    static_assert(always_false_v<T>, "non-exhaustive visitor!");
            },
            comment);
        const std::vector<std::string> &lines =
            std::visit([](const auto &arg) -> const std::vector<std::string> & { return arg.value; },
                       comment);

        std::string out;
        for (const std::string &line : lines) {
            if (line.empty())
                out += prefix + "\n";
            else
                out += prefix + " " + line + "\n";
        }
        return out;
    }

    std::string serializeMessage(const ast::Message &message, bool isTerm) {
        std::stringstream ss;
        if (message.getComment())
            ss << serializeComment(*message.getComment());
        if (isTerm)
            ss << "-";
        ss << message.getId() << " =";
        if (message.getPattern())
            ss << serializePattern(*message.getPattern());
        for (const ast::Attribute &attribute : message.getAttributes()) {
            ss << "\n" << INDENT << "." << attribute.getId() << " ="
               << indentExceptFirstLine(serializePattern(attribute.getPattern()));
        }
        ss << "\n";
        return ss.str();
    }

    std::string serializeEntry(const ast::Entry &entry) {
        return std::visit(
            [](const auto &arg) -> std::string {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, ast::AnyComment>)
                    return serializeComment(arg);
                else if constexpr (std::is_same_v<T, ast::Message>)
                    return serializeMessage(arg, false);
                else if constexpr (std::is_same_v<T, ast::Term>)
                    return serializeMessage(arg, true);
                else if constexpr (std::is_same_v<T, ast::Junk>)
                    return arg.value;
                else
                    static_assert(always_false_v<T>, "non-exhaustive visitor!");
            },
            entry);
    }

    std::string flattenSource(const std::optional<std::string> &value,
                              const AttributeList &attributes) {
        std::vector<std::string> parts;
        if (value && !value->empty())
            parts.push_back(*value);
        for (const auto &attribute : attributes) {
            if (attribute.second.find('\n') != std::string::npos)
                parts.push_back("." + attribute.first + " =\n" + attribute.second);
            else
                parts.push_back("." + attribute.first + " = " + attribute.second);
        }

        std::string source;
        for (size_t i = 0; i < parts.size(); i++) {
            if (i > 0)
                source += "\n";
            source += parts[i];
        }
        return source;
    }

    std::pair<std::optional<std::string>, AttributeList> splitSource(const ast::Message &message) {
        std::optional<std::string> value;
        if (message.getPattern())
            value = flattenPattern(*message.getPattern());

        AttributeList attributes;
        for (const ast::Attribute &attribute : message.getAttributes())
            attributes.emplace_back(attribute.getId(), flattenPattern(attribute.getPattern()));
        return std::make_pair(value, attributes);
    }

    std::string renderSource(const ast::Message &message) {
        auto split = splitSource(message);
        return flattenSource(split.first, split.second);
    }

    ast::Message parseUnitSource(const std::string &id, FluentType type, const std::string &source) {
        std::string wrapped = id + " =";
        for (const std::string &line : splitLines(source))
            wrapped += "\n" + INDENT + line;

        std::vector<ast::Entry> entries;
        try {
            entries = parse(wrapped);
        } catch (const ParseError &error) {
            const Diagnostic &diagnostic = error.diagnostics().front();
            auto position = toSourcePosition(diagnostic.line, diagnostic.column);
            throw SourceSyntaxError(id, diagnostic.code, diagnostic.message, position.first,
                                    position.second);
        }

        for (const ast::Entry &entry : entries) {
            if (auto *junk = std::get_if<ast::Junk>(&entry)) {
                auto wrappedPosition = lineColumn(wrapped, junk->offset);
                auto position = toSourcePosition(wrappedPosition.first, wrappedPosition.second);
                throw SourceSyntaxError(id, junk->code, junk->getMessage(), position.first,
                                        position.second);
            }
        }

        if (entries.size() == 1) {
            if (type == FluentType::Message && std::holds_alternative<ast::Message>(entries.front()))
                return std::get<ast::Message>(std::move(entries.front()));
            if (type == FluentType::Term && std::holds_alternative<ast::Term>(entries.front()))
                return std::get<ast::Term>(std::move(entries.front()));
        }
        throw SourceSyntaxError(id, "E0002", describeError("E0002", {}), 1, 1);
    }

    std::string renderUnit(const FluentUnit &unit) {
        switch (unit.getType()) {
            case FluentType::DetachedComment:
                return serializeComment(ast::Comment(splitLines(unit.getNotes())));
            case FluentType::GroupComment:
                return serializeComment(ast::GroupComment(splitLines(unit.getNotes())));
            case FluentType::ResourceComment:
                return serializeComment(ast::ResourceComment(splitLines(unit.getNotes())));
            case FluentType::Message:
            case FluentType::Term:
                break;
        }

        if (unit.isEmpty())
            return "";

        ast::Message message = parseUnitSource(unit.getId(), unit.getType(), unit.getSource());
        if (unit.hasNotes())
            message.setComment(ast::Comment(splitLines(unit.getNotes())));
        return serializeMessage(message, unit.getType() == FluentType::Term);
    }

} // namespace fluentstore
