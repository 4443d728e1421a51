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

#include "fluentstore/parser.hpp"
#include "grammar_error.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <lexy/action/parse.hpp>
#include <lexy/callback.hpp>
#include <lexy/dsl.hpp>
#include <lexy/input/string_input.hpp>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <unicode/utf8.h>
#include <variant>
#include <vector>

#ifdef DEBUG_PARSER
#include <cstdio>
#include <lexy/action/parse_as_tree.hpp>
#include <lexy/action/trace.hpp>
#include <lexy/visualize.hpp>
#include <lexy_ext/report_error.hpp>
#endif

namespace fluentstore {
    namespace {
        // lexy positions are pointers into the parsed std::string
        template <typename Iterator> const char *toPointer(Iterator position) {
            return reinterpret_cast<const char *>(position);
        }

        // Line ends and indent at the start of a line of a multiline pattern.
        // The common indent of all lines is removed once the whole pattern is known.
        struct Indent {
            // One \n per line end, whether it was written as LF or CRLF
            std::string lineEnds;
            size_t width;
        };

        template <typename Lexeme> Indent makeIndent(const Lexeme &prefix) {
            std::string text(prefix.begin(), prefix.end());
            size_t lineEnds = std::count(text.begin(), text.end(), '\n');
            size_t lastLineEnd = text.rfind('\n');
            size_t width = lastLineEnd == std::string::npos ? text.size()
                                                             : text.size() - lastLineEnd - 1;
            return Indent{std::string(lineEnds, '\n'), width};
        }

        // A PatternElement as it was read, with the indent of its line if it starts one
        struct RawElement {
            std::optional<Indent> indent;
            std::variant<std::string, ast::Placeable> content;
        };

        struct RawVariant {
            const char *position;
            ast::Variant variant;
        };

        // A call argument before named and positional arguments are told apart
        struct RawArgument {
            const char *position;
            ast::Expression expression;
            std::optional<ast::Literal> value;
        };

        struct ParsedEntry {
            ast::Entry entry;
            const char *end;
        };

        /**
         * Removes the common indent from the start of each line, merges adjacent
         * text, and trims trailing whitespace from the end of the pattern.
         */
        ast::Pattern dedent(std::vector<RawElement> &&elements) {
            size_t commonIndent = std::numeric_limits<size_t>::max();
            for (const RawElement &element : elements) {
                if (element.indent)
                    commonIndent = std::min(commonIndent, element.indent->width);
            }

            std::vector<ast::PatternElement> trimmed;
            auto appendText = [&trimmed](std::string &&text) {
                if (!trimmed.empty()) {
                    if (auto *previous = std::get_if<std::string>(&trimmed.back())) {
                        *previous += text;
                        return;
                    }
                }
                trimmed.push_back(std::move(text));
            };

            for (size_t i = 0; i < elements.size(); i++) {
                RawElement &element = elements[i];
                if (element.indent) {
                    // Blank lines in front of a pattern starting on a new line are not
                    // part of its value
                    std::string text = i == 0 ? std::string() : element.indent->lineEnds;
                    text.append(element.indent->width - commonIndent, ' ');
                    if (!text.empty())
                        appendText(std::move(text));
                }

                if (auto *text = std::get_if<std::string>(&element.content))
                    appendText(std::move(*text));
                else
                    trimmed.push_back(std::move(std::get<ast::Placeable>(element.content)));
            }

            if (!trimmed.empty()) {
                if (auto *last = std::get_if<std::string>(&trimmed.back())) {
                    size_t end = last->find_last_not_of(" \n\r");
                    if (end == std::string::npos)
                        trimmed.pop_back();
                    else
                        last->erase(end + 1);
                }
            }
            return ast::Pattern(std::move(trimmed));
        }

        ast::CallArguments makeCallArguments(std::vector<RawArgument> &&arguments) {
            ast::CallArguments result;
            std::set<std::string> names;

            for (RawArgument &argument : arguments) {
                if (argument.value) {
                    auto *name = std::get_if<ast::MessageReference>(&argument.expression.value);
                    if (!name || name->attribute)
                        throw GrammarError("E0009", {}, argument.position);
                    if (!names.insert(name->identifier).second)
                        throw GrammarError("E0022", {}, argument.position);
                    result.named.emplace_back(std::move(name->identifier),
                                              std::move(*argument.value));
                } else if (!names.empty()) {
                    throw GrammarError("E0021", {}, argument.position);
                } else {
                    result.positional.push_back(std::move(argument.expression));
                }
            }
            return result;
        }

        std::vector<ast::Variant> makeVariants(std::vector<RawVariant> &&variants,
                                               const char *end) {
            std::vector<ast::Variant> result;
            bool hasDefault = false;
            for (RawVariant &variant : variants) {
                if (variant.variant.isDefault) {
                    if (hasDefault)
                        throw GrammarError("E0015", {}, variant.position);
                    hasDefault = true;
                }
                result.push_back(std::move(variant.variant));
            }
            if (!hasDefault)
                throw GrammarError("E0010", {}, end);
            return result;
        }

        ast::Expression makeSelectExpression(ast::Expression &&selector,
                                             std::vector<ast::Variant> &&variants,
                                             const char *arrow) {
            if (auto *message = std::get_if<ast::MessageReference>(&selector.value)) {
                throw GrammarError(message->attribute ? "E0018" : "E0016", {}, arrow);
            } else if (auto *term = std::get_if<ast::TermReference>(&selector.value)) {
                if (!term->attribute)
                    throw GrammarError("E0017", {}, arrow);
            } else if (std::holds_alternative<ast::Placeable>(selector.value)) {
                throw GrammarError("E0029", {}, arrow);
            }
            return ast::SelectExpression(std::move(selector), std::move(variants));
        }

        ast::Expression checkPlaceable(ast::Expression &&expression, const char *position) {
            if (auto *term = std::get_if<ast::TermReference>(&expression.value)) {
                if (term->attribute)
                    throw GrammarError("E0019", {}, position);
            }
            return std::move(expression);
        }
    } // namespace

    namespace grammar {
        namespace dsl = lexy::dsl;

        /*
        * This grammar is derived from the project fluent EBNF specification
        * https://github.com/projectfluent/fluent/blob/master/spec/fluent.ebnf
        *
        * Parts of the specification have been included for reference and clarity
        *  (some formatting changes have been made).
        * Project Fluent is licensed under the Apache 2.0 license.
        */

        // Each error tag names the diagnostic reported for it
        struct expected_entry {
            static constexpr auto name = "expected an entry start";
            static constexpr auto code = "E0002";
        };
        struct expected_line_end {
            static constexpr auto name = "expected a line end";
            static constexpr auto code = "E0003";
            static constexpr auto argument = "␤";
        };
        struct expected_space {
            static constexpr auto name = "expected a space after the comment sigil";
            static constexpr auto code = "E0003";
            static constexpr auto argument = " ";
        };
        struct expected_identifier {
            static constexpr auto name = "expected an identifier";
            static constexpr auto code = "E0004";
            static constexpr auto argument = "a-zA-Z";
        };
        struct expected_digits {
            static constexpr auto name = "expected digits";
            static constexpr auto code = "E0004";
            static constexpr auto argument = "0-9";
        };
        struct missing_message_value {
            static constexpr auto name = "message must contain a pattern or an attribute";
            static constexpr auto code = "E0005";
        };
        struct missing_term_value {
            static constexpr auto name = "term must contain a pattern";
            static constexpr auto code = "E0006";
        };
        struct invalid_callee {
            static constexpr auto name = "function names must be upper case";
            static constexpr auto code = "E0008";
        };
        struct expected_variant {
            static constexpr auto name = "expected a variant";
            static constexpr auto code = "E0011";
        };
        struct expected_value {
            static constexpr auto name = "expected a pattern";
            static constexpr auto code = "E0012";
        };
        struct expected_variant_key {
            static constexpr auto name = "expected a variant key";
            static constexpr auto code = "E0013";
        };
        struct missing_literal {
            static constexpr auto name = "named arguments must be literals";
            static constexpr auto code = "E0014";
        };
        struct unterminated_string {
            static constexpr auto name = "unterminated string literal";
            static constexpr auto code = "E0020";
        };
        struct unknown_escape {
            static constexpr auto name = "unknown escape sequence";
            static constexpr auto code = "E0025";
        };
        struct invalid_unicode_escape {
            static constexpr auto name = "invalid unicode escape sequence";
            static constexpr auto code = "E0026";
        };
        struct unbalanced_closing_brace {
            static constexpr auto name = "unbalanced closing brace";
            static constexpr auto code = "E0027";
        };
        struct expected_inline_expression {
            static constexpr auto name = "expected an inline expression";
            static constexpr auto code = "E0028";
        };

        template <typename Tag, typename = void> struct has_code : std::false_type {};
        template <typename Tag>
        struct has_code<Tag, std::void_t<decltype(Tag::code)>> : std::true_type {};

        template <typename Tag, typename = void> struct has_argument : std::false_type {};
        template <typename Tag>
        struct has_argument<Tag, std::void_t<decltype(Tag::argument)>> : std::true_type {};

        template <typename Error> struct error_tag;
        template <typename Reader, typename Tag> struct error_tag<lexy::error<Reader, Tag>> {
            using type = Tag;
        };

        // Turns a lexy error into the diagnostic it stands for
        static constexpr auto to_grammar_error =
            lexy::callback<GrammarError>([](const auto &, const auto &error) {
                using tag = typename error_tag<std::decay_t<decltype(error)>>::type;
                if constexpr (std::is_same_v<tag, lexy::expected_literal>) {
                    std::string token(reinterpret_cast<const char *>(error.string()),
                                      error.length());
                    return GrammarError("E0003", {token}, toPointer(error.position()));
                } else if constexpr (has_code<tag>::value) {
                    std::vector<std::string> arguments;
                    if constexpr (has_argument<tag>::value)
                        arguments.emplace_back(tag::argument);
                    return GrammarError(tag::code, std::move(arguments),
                                        toPointer(error.position()));
                } else {
                    return GrammarError("E0001", {}, toPointer(error.position()));
                }
            });

        // A CR only ends a line when it is followed by LF
        static constexpr auto lone_cr = dsl::token(dsl::lit_c<'\r'> + dsl::peek_not(dsl::lit_c<'\n'>));
        static constexpr auto plain_text_char = dsl::code_point - dsl::lit_c<'{'> - dsl::lit_c<'}'> - dsl::lit_c<'\n'> - dsl::lit_c<'\r'>;
        // text_char           ::= any_char - special_text_char - line_end
        static constexpr auto text_char = plain_text_char | lone_cr;
        // indented_char       ::= text_char - "[" - "*" - "."
        static constexpr auto indented_char = plain_text_char - dsl::lit_c<'['> - dsl::lit_c<'*'> - dsl::lit_c<'.'>;
        // blank_inline        ::= " "+
        static constexpr auto blank_inline = dsl::while_one(dsl::lit_c<' '>);
        static constexpr auto blank_line = dsl::peek(dsl::while_(dsl::lit_c<' '>) + dsl::newline) >> dsl::while_(dsl::lit_c<' '>) + dsl::newline;
        // blank_block         ::= (blank_inline? line_end)+
        static constexpr auto blank_block = dsl::while_one(blank_line);
        // blank               ::= (blank_inline | line_end)+
        static constexpr auto opt_blank = dsl::while_(blank_inline | dsl::newline);

        static constexpr auto entry_end = dsl::eol | dsl::error<expected_line_end>;

        // Blank lines between entries, and blanks at the end of the input
        struct BlankBlock : lexy::token_production {
            static constexpr auto rule = dsl::while_(blank_line) + dsl::if_(dsl::peek(dsl::while_(dsl::lit_c<' '>) + dsl::eof) >> dsl::while_(dsl::lit_c<' '>)) + dsl::position;
            static constexpr auto value = lexy::callback<const char *>([](auto end) { return toPointer(end); });
        };

        // Text of a comment line, after the sigil
        // CommentLine         ::= ("###" | "##" | "#") (" " comment_char*)? line_end
        struct CommentText : lexy::token_production {
            static constexpr auto rule = [] {
                // \r is not considered a newline, but may appear by itself in the text
                auto contents = dsl::capture(dsl::while_(dsl::code_point - dsl::newline));
                return (dsl::lit_c<' '> >> contents | dsl::peek(dsl::eol) >> contents | dsl::error<expected_space>) + dsl::eol;
            }();
            static constexpr auto value = lexy::callback<std::string>([](auto lexeme) {
                std::string line(lexeme.begin(), lexeme.end());
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                return line;
            });
        };

        // A comment only continues on lines with the same sigil
        struct MessageCommentLine : lexy::token_production {
            static constexpr auto rule = dsl::peek(LEXY_LIT("#") + (dsl::lit_c<' '> / dsl::eol)) >> LEXY_LIT("#") + dsl::p<CommentText>;
            static constexpr auto value = lexy::forward<std::string>;
        };

        struct MessageCommentLines {
            static constexpr auto rule = dsl::opt(dsl::list(dsl::p<MessageCommentLine>));
            static constexpr auto value = lexy::as_list<std::vector<std::string>>;
        };

        struct MessageComment {
            static constexpr auto rule = LEXY_LIT("#") >> dsl::p<CommentText> + dsl::p<MessageCommentLines>;
            static constexpr auto value = lexy::callback<ast::AnyComment>(
                [](std::string first, std::vector<std::string> lines) {
                    lines.insert(lines.begin(), std::move(first));
                    return ast::AnyComment(ast::Comment(std::move(lines)));
                });
        };

        struct GroupCommentLine : lexy::token_production {
            static constexpr auto rule = dsl::peek(LEXY_LIT("##") + (dsl::lit_c<' '> / dsl::eol)) >> LEXY_LIT("##") + dsl::p<CommentText>;
            static constexpr auto value = lexy::forward<std::string>;
        };

        struct GroupCommentLines {
            static constexpr auto rule = dsl::opt(dsl::list(dsl::p<GroupCommentLine>));
            static constexpr auto value = lexy::as_list<std::vector<std::string>>;
        };

        struct GroupComment {
            static constexpr auto rule = LEXY_LIT("##") >> dsl::p<CommentText> + dsl::p<GroupCommentLines>;
            static constexpr auto value = lexy::callback<ast::AnyComment>(
                [](std::string first, std::vector<std::string> lines) {
                    lines.insert(lines.begin(), std::move(first));
                    return ast::AnyComment(ast::GroupComment(std::move(lines)));
                });
        };

        struct ResourceCommentLine : lexy::token_production {
            static constexpr auto rule = dsl::peek(LEXY_LIT("###") + (dsl::lit_c<' '> / dsl::eol)) >> LEXY_LIT("###") + dsl::p<CommentText>;
            static constexpr auto value = lexy::forward<std::string>;
        };

        struct ResourceCommentLines {
            static constexpr auto rule = dsl::opt(dsl::list(dsl::p<ResourceCommentLine>));
            static constexpr auto value = lexy::as_list<std::vector<std::string>>;
        };

        struct ResourceComment {
            static constexpr auto rule = LEXY_LIT("###") >> dsl::p<CommentText> + dsl::p<ResourceCommentLines>;
            static constexpr auto value = lexy::callback<ast::AnyComment>(
                [](std::string first, std::vector<std::string> lines) {
                    lines.insert(lines.begin(), std::move(first));
                    return ast::AnyComment(ast::ResourceComment(std::move(lines)));
                });
        };

        // The longest sigil decides the kind of comment
        struct Comment {
            static constexpr auto rule = dsl::p<ResourceComment> | dsl::p<GroupComment> | dsl::p<MessageComment>;
            static constexpr auto value = lexy::forward<ast::AnyComment>;
        };

        // junk_line           ::= /[^\n]*/ ("\u000A" | EOF)
        static constexpr auto junk_line = dsl::until(dsl::eol);
        static constexpr auto junk_lines = dsl::while_(dsl::peek_not(dsl::lit_c<'#'> / dsl::lit_c<'-'> / dsl::ascii::alpha / dsl::eof) >> junk_line);

        // Junk                ::= junk_line (junk_line - "#" - "-" - [a-zA-Z])*
        struct Junk : lexy::token_production {
            static constexpr auto rule = junk_line + junk_lines + dsl::position;
            static constexpr auto value = lexy::callback<const char *>([](auto end) { return toPointer(end); });
        };

        // The remaining lines of Junk, starting at the beginning of a line
        struct JunkLines : lexy::token_production {
            static constexpr auto rule = junk_lines + dsl::position;
            static constexpr auto value = lexy::callback<const char *>([](auto end) { return toPointer(end); });
        };

        // Identifier          ::= [a-zA-Z] [a-zA-Z0-9_-]*
        static constexpr auto identifier = dsl::identifier(dsl::ascii::alpha, dsl::ascii::alpha_digit_underscore / dsl::lit_c<'-'>);

        struct Identifier : lexy::token_production {
            static constexpr auto rule = identifier;
            static constexpr auto value = lexy::as_string<std::string, lexy::utf8_encoding>;
        };

        static constexpr auto required_identifier = dsl::p<Identifier> | dsl::error<expected_identifier>;

        // AttributeAccessor   ::= "." Identifier
        struct AttributeAccessor {
            static constexpr auto rule = dsl::lit_c<'.'> >> required_identifier;
            static constexpr auto value = lexy::forward<std::string>;
        };

        // VariableReference   ::= "$" Identifier
        struct VariableReference : lexy::token_production {
            static constexpr auto rule = dsl::lit_c<'$'> >> required_identifier;
            static constexpr auto value = lexy::construct<ast::VariableReference>;
        };

        // NumberLiteral       ::= "-"? digits ("." digits)?
        struct NumberLiteral : lexy::token_production {
            static constexpr auto rule = [] {
                auto digits = dsl::digits<>;
                auto decimal = dsl::if_(dsl::lit_c<'.'> >> (digits | dsl::error<expected_digits>));
                // Peek is necessary to ensure that negative NumberLiterals can be distinguished
                // from terms
                return dsl::peek(dsl::if_(dsl::lit_c<'-'>) + dsl::ascii::digit) >>
                    dsl::capture(dsl::if_(dsl::lit_c<'-'>) + digits + decimal);
            }();
            static constexpr auto value = lexy::as_string<std::string, lexy::utf8_encoding> |
                                          lexy::construct<ast::NumberLiteral>;
        };

        // StringLiteral       ::= "\"" quoted_char* "\""
        // Escape sequences are validated, but kept as written
        struct StringLiteral : lexy::token_production {
            static constexpr auto rule = [] {
                auto quoted_char = dsl::code_point - dsl::lit_c<'"'> - dsl::lit_c<'\\'> - dsl::newline;
                // special_escape      ::= "\\" ("\"" | "\\")
                // unicode_escape      ::= ("\\u" /[0-9a-fA-F]{4}/) | ("\\U" /[0-9a-fA-F]{6}/)
                auto escape = dsl::lit_c<'\\'> >>
                    (dsl::lit_c<'\\'>
                     | dsl::lit_c<'"'>
                     | dsl::token(dsl::lit_c<'u'> + dsl::n_digits<4, dsl::hex>)
                     | dsl::token(dsl::lit_c<'U'> + dsl::n_digits<6, dsl::hex>)
                     | dsl::peek(dsl::lit_c<'u'> / dsl::lit_c<'U'>) >> dsl::error<invalid_unicode_escape>
                     | dsl::error<unknown_escape>);
                auto close = dsl::lit_c<'"'> | dsl::error<unterminated_string>;
                return dsl::lit_c<'"'> >> dsl::capture(dsl::while_(quoted_char | escape)) + close;
            }();
            static constexpr auto value = lexy::as_string<std::string, lexy::utf8_encoding> |
                                          lexy::construct<ast::StringLiteral>;
        };

        struct Literal {
            static constexpr auto rule = dsl::p<NumberLiteral> | dsl::p<StringLiteral>;
            static constexpr auto value = lexy::construct<ast::Literal>;
        };

        struct inline_placeable;
        struct CallArguments;
        struct Pattern;

        // MessageReference    ::= Identifier AttributeAccessor?
        struct MessageReference : lexy::token_production {
            static constexpr auto rule = dsl::p<Identifier> >> dsl::opt(dsl::p<AttributeAccessor>);
            static constexpr auto value = lexy::construct<ast::MessageReference>;
        };

        // TermReference       ::= "-" Identifier AttributeAccessor? CallArguments?
        struct TermReference : lexy::token_production {
            static constexpr auto rule = dsl::lit_c<'-'> >> required_identifier +
                dsl::opt(dsl::p<AttributeAccessor>) +
                dsl::opt(dsl::peek(opt_blank + dsl::lit_c<'('>) >> dsl::recurse<CallArguments>);
            static constexpr auto value = lexy::callback<ast::TermReference>(
                [](std::string id, std::optional<std::string> attribute,
                   std::optional<std::vector<RawArgument>> arguments) {
                    std::optional<ast::CallArguments> callArguments;
                    if (arguments)
                        callArguments = makeCallArguments(std::move(*arguments));
                    return ast::TermReference(std::move(id), std::move(attribute),
                                              std::move(callArguments));
                });
        };

        // FunctionReference   ::= Identifier CallArguments
        struct FunctionReference : lexy::token_production {
            static constexpr auto rule = [] {
                auto callee = dsl::identifier(dsl::ascii::upper, dsl::ascii::upper / dsl::ascii::digit / dsl::lit_c<'_'> / dsl::lit_c<'-'>);
                return dsl::peek(callee + opt_blank + dsl::lit_c<'('>) >> dsl::p<Identifier> + dsl::recurse<CallArguments>;
            }();
            static constexpr auto value = lexy::callback<ast::FunctionReference>(
                [](std::string id, std::vector<RawArgument> arguments) {
                    return ast::FunctionReference(std::move(id),
                                                  makeCallArguments(std::move(arguments)));
                });
        };

        // InlineExpression    ::= StringLiteral | NumberLiteral | FunctionReference |
        // MessageReference | TermReference | VariableReference | inline_placeable
        struct InlineExpression {
            // Note: order is necessary for parsing
            static constexpr auto rule = [] {
                auto lower_case_callee = dsl::peek(identifier + opt_blank + dsl::lit_c<'('>) >> dsl::error<invalid_callee>;
                return dsl::p<NumberLiteral>
                    |  dsl::p<StringLiteral>
                    |  dsl::p<VariableReference>
                    |  dsl::p<TermReference>
                    |  dsl::p<FunctionReference>
                    |  lower_case_callee
                    |  dsl::p<MessageReference>
                    |  dsl::recurse_branch<inline_placeable>
                    |  dsl::error<expected_inline_expression>;
            }();
            static constexpr auto value = lexy::construct<ast::Expression>;
        };

        // Argument            ::= NamedArgument | InlineExpression
        // NamedArgument       ::= Identifier blank? ":" blank? (StringLiteral | NumberLiteral)
        struct Argument {
            static constexpr auto rule = [] {
                auto named = dsl::lit_c<':'> >> opt_blank + (dsl::p<Literal> | dsl::error<missing_literal>);
                return dsl::peek_not(dsl::lit_c<')'>) >> dsl::position + dsl::p<InlineExpression> + opt_blank + dsl::opt(named) + opt_blank;
            }();
            static constexpr auto value = lexy::callback<RawArgument>(
                [](auto position, ast::Expression expression, lexy::nullopt) {
                    return RawArgument{toPointer(position), std::move(expression), std::nullopt};
                },
                [](auto position, ast::Expression expression, ast::Literal value) {
                    return RawArgument{toPointer(position), std::move(expression), std::move(value)};
                });
        };

        // CallArguments       ::= blank? "(" blank? argument_list blank? ")"
        // argument_list       ::= (Argument blank? "," blank?)* Argument?
        struct CallArguments {
            static constexpr auto rule = opt_blank + dsl::lit_c<'('> + opt_blank +
                dsl::opt(dsl::list(dsl::p<Argument>, dsl::trailing_sep(dsl::lit_c<','> >> opt_blank))) +
                dsl::lit_c<')'>;
            static constexpr auto value = lexy::as_list<std::vector<RawArgument>>;
        };

        // VariantKey          ::= "[" blank? (NumberLiteral | Identifier) blank? "]"
        struct VariantKey {
            static constexpr auto rule = dsl::lit_c<'['> + opt_blank +
                (dsl::p<NumberLiteral> | dsl::p<Identifier> | dsl::error<expected_variant_key>) +
                opt_blank + dsl::lit_c<']'>;
            static constexpr auto value = lexy::construct<ast::VariantKey>;
        };

        // Variant             ::= line_end blank? VariantKey blank_inline? Pattern
        // DefaultVariant      ::= line_end blank? "*" VariantKey blank_inline? Pattern
        struct Variant {
            static constexpr auto rule = [] {
                auto start = dsl::peek(opt_blank + (dsl::lit_c<'['> | LEXY_LIT("*[")));
                auto default_marker = dsl::capture(dsl::if_(dsl::lit_c<'*'>));
                auto value = dsl::recurse_branch<Pattern> | dsl::error<expected_value>;
                return start >> opt_blank + dsl::position + default_marker + dsl::p<VariantKey> + dsl::if_(blank_inline) + value;
            }();
            static constexpr auto value = lexy::callback<RawVariant>(
                [](auto position, auto marker, ast::VariantKey key, std::vector<RawElement> pattern) {
                    ast::Variant variant(std::move(key), dedent(std::move(pattern)), marker.size() > 0);
                    return RawVariant{toPointer(position), std::move(variant)};
                });
        };

        struct Variants {
            static constexpr auto rule = [] {
                auto start = dsl::peek(opt_blank + (dsl::lit_c<'['> | LEXY_LIT("*[")));
                return start >> dsl::list(dsl::p<Variant>) | dsl::error<expected_variant>;
            }();
            static constexpr auto value = lexy::as_list<std::vector<RawVariant>>;
        };

        // The part of a SelectExpression following its selector
        // SelectExpression    ::= InlineExpression blank? "->" blank_inline? variant_list
        // variant_list        ::= Variant* DefaultVariant Variant* line_end
        struct SelectExpression {
            static constexpr auto rule = LEXY_LIT("->") >> dsl::if_(blank_inline) +
                (dsl::newline | dsl::error<expected_line_end>) + dsl::p<Variants> + opt_blank +
                dsl::position;
            static constexpr auto value = lexy::callback<std::vector<ast::Variant>>(
                [](std::vector<RawVariant> variants, auto end) {
                    return makeVariants(std::move(variants), toPointer(end));
                });
        };

        // SelectExpression | InlineExpression
        struct PlaceableContent {
            static constexpr auto rule = dsl::p<InlineExpression> + opt_blank + dsl::position + dsl::opt(dsl::p<SelectExpression>);
            static constexpr auto value = lexy::callback<ast::Expression>(
                [](ast::Expression expression, auto position, lexy::nullopt) {
                    return checkPlaceable(std::move(expression), toPointer(position));
                },
                [](ast::Expression selector, auto arrow, std::vector<ast::Variant> variants) {
                    return makeSelectExpression(std::move(selector), std::move(variants),
                                                toPointer(arrow));
                });
        };

        // inline_placeable    ::= "{" blank? (SelectExpression | InlineExpression) blank? "}"
        struct inline_placeable : lexy::token_production {
            static constexpr auto rule = dsl::lit_c<'{'> >> opt_blank + dsl::p<PlaceableContent> + opt_blank + dsl::lit_c<'}'>;
            static constexpr auto value = lexy::construct<ast::Placeable>;
        };

        static constexpr auto block_text_start = dsl::token(blank_block + blank_inline + indented_char);
        static constexpr auto block_placeable_start = dsl::token(blank_block + dsl::if_(blank_inline) + dsl::lit_c<'{'>);

        // block_placeable     ::= blank_block blank_inline? inline_placeable
        struct block_placeable : lexy::token_production {
            static constexpr auto rule = dsl::peek(block_placeable_start) >> dsl::capture(blank_block + dsl::if_(blank_inline)) + dsl::p<inline_placeable>;
            static constexpr auto value = lexy::callback<RawElement>(
                [](auto prefix, ast::Placeable placeable) {
                    return RawElement{makeIndent(prefix), std::move(placeable)};
                });
        };

        // inline_text         ::= text_char+
        struct inline_text : lexy::token_production {
            static constexpr auto rule = dsl::peek(text_char) >> dsl::capture(dsl::while_(text_char));
            static constexpr auto value = lexy::callback<RawElement>([](auto text) {
                return RawElement{std::nullopt, std::string(text.begin(), text.end())};
            });
        };

        // block_text          ::= blank_block blank_inline indented_char inline_text?
        struct block_text : lexy::token_production {
            static constexpr auto rule = [] {
                // Note: the indent needs to be captured as a whole as we will remove
                // matching indents from the pattern later
                auto block_prefix = dsl::capture(blank_block + blank_inline);
                auto text = dsl::capture(dsl::token(indented_char + dsl::while_(text_char)));
                return dsl::peek(block_text_start) >> block_prefix + text;
            }();
            static constexpr auto value = lexy::callback<RawElement>([](auto prefix, auto text) {
                return RawElement{makeIndent(prefix), std::string(text.begin(), text.end())};
            });
        };

        // PatternElement      ::= inline_text | block_text | inline_placeable | block_placeable
        struct PatternElement : lexy::token_production {
            static constexpr auto rule = dsl::p<block_text> | dsl::p<block_placeable> | dsl::p<inline_placeable> | dsl::p<inline_text>;
            static constexpr auto value = lexy::callback<RawElement>(
                [](RawElement element) { return element; },
                [](ast::Placeable placeable) {
                    return RawElement{std::nullopt, std::move(placeable)};
                });
        };

        /* Patterns are values of Messages, Terms, Attributes and Variants. */
        // Pattern             ::= PatternElement+
        struct Pattern : lexy::token_production {
            static constexpr auto rule = [] {
                auto start = dsl::peek(text_char | dsl::lit_c<'{'> | block_text_start | block_placeable_start);
                auto closing_brace = dsl::peek(dsl::lit_c<'}'>) >> dsl::error<unbalanced_closing_brace>;
                return start >> dsl::list(dsl::p<PatternElement>) + dsl::if_(closing_brace);
            }();
            static constexpr auto value = lexy::as_list<std::vector<RawElement>>;
        };

        static constexpr auto attribute_start = dsl::newline + opt_blank + dsl::lit_c<'.'>;

        // Attribute ::= line_end blank? "." Identifier blank_inline? "=" blank_inline? Pattern
        struct Attribute : lexy::token_production {
            static constexpr auto rule = dsl::token(attribute_start) >> required_identifier + dsl::if_(blank_inline) + dsl::lit_c<'='> + dsl::if_(blank_inline) + (dsl::p<Pattern> | dsl::error<expected_value>);
            static constexpr auto value = lexy::callback<ast::Attribute>(
                [](std::string id, std::vector<RawElement> pattern) {
                    return ast::Attribute(std::move(id), dedent(std::move(pattern)));
                });
        };

        struct Attributes : lexy::token_production {
            static constexpr auto rule = dsl::opt(dsl::list(dsl::p<Attribute>));
            static constexpr auto value = lexy::as_list<std::vector<ast::Attribute>>;
        };

        // Term ::= "-" Identifier blank_inline? "=" blank_inline? Pattern Attribute*
        struct Term {
            static constexpr auto rule = dsl::lit_c<'-'> >> required_identifier + dsl::if_(blank_inline) + dsl::lit_c<'='> + dsl::if_(blank_inline) + (dsl::p<Pattern> | dsl::error<missing_term_value>) + dsl::p<Attributes> + entry_end;
            static constexpr auto value = lexy::callback<ast::Term>(
                [](std::string id, std::vector<RawElement> pattern,
                   std::vector<ast::Attribute> attributes) {
                    return ast::Term(std::move(id), dedent(std::move(pattern)), std::move(attributes));
                });
        };

        // Message ::= Identifier blank_inline? "="
        //   blank_inline? ((Pattern Attribute*) | (Attribute+))
        struct Message {
            static constexpr auto rule = [] {
                auto value = dsl::p<Pattern> >> dsl::p<Attributes> | dsl::peek(attribute_start) >> dsl::p<Attributes> | dsl::error<missing_message_value>;
                return dsl::p<Identifier> >> dsl::if_(blank_inline) + dsl::lit_c<'='> + dsl::if_(blank_inline) + value + entry_end;
            }();
            static constexpr auto value = lexy::callback<ast::Message>(
                [](std::string id, std::vector<RawElement> pattern,
                   std::vector<ast::Attribute> attributes) {
                    return ast::Message(std::move(id), dedent(std::move(pattern)), std::move(attributes));
                },
                [](std::string id, std::vector<ast::Attribute> attributes) {
                    return ast::Message(std::move(id), std::nullopt, std::move(attributes));
                });
        };

        // Entry               ::= (Message line_end) | (Term line_end) | CommentLine
        // Comments are attached to the following Message or Term by the resource loop
        struct Entry {
            static constexpr auto rule = (dsl::p<Comment> | dsl::p<Term> | dsl::p<Message> | dsl::error<expected_entry>) + dsl::position;
            static constexpr auto value = lexy::callback<ParsedEntry>([](auto entry, auto end) {
                return ParsedEntry{ast::Entry(std::move(entry)), toPointer(end)};
            });
        };
    } // namespace grammar

    namespace {
        // Resource            ::= (Entry | blank_block | Junk)*
        class ResourceParser {
            const std::string &source;

          public:
            explicit ResourceParser(const std::string &source) : source(source) {}

            std::vector<ast::Entry> getResource() const;

          private:
            lexy::string_input<lexy::utf8_encoding> inputAt(size_t offset) const {
                return lexy::string_input<lexy::utf8_encoding>(this->source.data() + offset,
                                                               this->source.size() - offset);
            }

            size_t offsetOf(const char *position) const { return position - this->source.data(); }

            // Offset after a production which produces its end position and cannot fail
            template <typename Production> size_t skip(size_t offset) const {
                auto result = lexy::parse<Production>(this->inputAt(offset), lexy::noop);
                return this->offsetOf(result.value());
            }

            ast::Entry getEntryOrJunk(size_t start, size_t &end) const;
            size_t skipJunk(size_t entryStart, size_t errorOffset) const;
            std::vector<std::string> errorArguments(GrammarError &error, size_t entryStart) const;
            std::string codePointAt(size_t offset) const;
        };

        std::vector<ast::Entry> ResourceParser::getResource() const {
            std::vector<ast::Entry> entries;
            std::optional<ast::Comment> lastComment;

            size_t offset = this->skip<grammar::BlankBlock>(0);
            while (offset < this->source.size()) {
                size_t entryEnd = offset;
                ast::Entry entry = this->getEntryOrJunk(offset, entryEnd);
                offset = this->skip<grammar::BlankBlock>(entryEnd);

                // A Comment is attached to a Message or Term directly following it.
                // It only becomes standalone once we know what comes next, as a
                // Comment followed by Junk stays standalone.
                auto *anyComment = std::get_if<ast::AnyComment>(&entry);
                if (anyComment && std::holds_alternative<ast::Comment>(*anyComment) &&
                    offset == entryEnd && offset < this->source.size()) {
                    lastComment = std::get<ast::Comment>(std::move(*anyComment));
                    continue;
                }

                if (lastComment) {
                    if (auto *message = std::get_if<ast::Message>(&entry)) {
                        message->setComment(std::move(*lastComment));
                    } else if (auto *term = std::get_if<ast::Term>(&entry)) {
                        term->setComment(std::move(*lastComment));
                    } else {
                        entries.push_back(ast::AnyComment(std::move(*lastComment)));
                    }
                    lastComment.reset();
                }
                entries.push_back(std::move(entry));
            }
            return entries;
        }

        ast::Entry ResourceParser::getEntryOrJunk(size_t start, size_t &end) const {
            auto input = this->inputAt(start);
#ifdef DEBUG_PARSER
            lexy::trace<grammar::Entry>(stdout, input);

            lexy::parse_tree_for<decltype(input)> tree;
            lexy::parse_as_tree<grammar::Entry>(tree, input, lexy_ext::report_error);
            lexy::visualize(stdout, tree, {lexy::visualize_fancy});
#endif

            std::optional<GrammarError> failure;
            try {
                auto result = lexy::parse<grammar::Entry>(
                    input, lexy::collect<std::vector<GrammarError>>(grammar::to_grammar_error));
                if (result) {
                    ParsedEntry parsed = std::move(result).value();
                    end = this->offsetOf(parsed.end);
                    return std::move(parsed.entry);
                }
                if (result.errors().empty())
                    failure = GrammarError("E0001", {}, this->source.data() + start);
                else
                    failure = result.errors().front();
            } catch (GrammarError &error) {
                failure = std::move(error);
            }

            size_t errorOffset = this->offsetOf(failure->position);
            size_t nextEntryStart = this->skipJunk(start, errorOffset);
            // The position of the error must be inside of the Junk's span
            if (nextEntryStart < errorOffset)
                errorOffset = nextEntryStart;

            std::vector<std::string> arguments = this->errorArguments(*failure, start);
            end = nextEntryStart;
            return ast::Junk(this->source.substr(start, nextEntryStart - start),
                             std::move(failure->code), std::move(arguments), errorOffset);
        }

        /*
         * Junk covers every line of the broken entry up to the line of the error.
         * From there it extends to the next line which looks like the start of an entry.
         */
        size_t ResourceParser::skipJunk(size_t entryStart, size_t errorOffset) const {
            size_t lastNewline =
                errorOffset == 0 ? std::string::npos : this->source.rfind('\n', errorOffset - 1);
            if (lastNewline != std::string::npos && lastNewline > entryStart)
                return this->skip<grammar::JunkLines>(lastNewline + 1);
            return this->skip<grammar::Junk>(errorOffset);
        }

        std::string ResourceParser::codePointAt(size_t offset) const {
            if (offset >= this->source.size())
                return "";
            int32_t end = static_cast<int32_t>(offset);
            UChar32 codePoint;
            U8_NEXT(this->source.data(), end, static_cast<int32_t>(this->source.size()), codePoint);
            return this->source.substr(offset, end - offset);
        }

        // Some messages quote the source around the error
        std::vector<std::string> ResourceParser::errorArguments(GrammarError &error,
                                                                size_t entryStart) const {
            size_t offset = this->offsetOf(error.position);

            if (error.code == "E0005" || error.code == "E0006") {
                size_t idStart = error.code == "E0006" ? entryStart + 1 : entryStart;
                auto id = lexy::parse<grammar::Identifier>(this->inputAt(idStart), lexy::noop);
                if (id)
                    return {id.value()};
            } else if (error.code == "E0025") {
                return {this->codePointAt(offset)};
            } else if (error.code == "E0026") {
                // The sequence up to and including the first character which is not a hex digit
                size_t digits = this->source[offset] == 'u' ? 4 : 6;
                std::string sequence = "\\" + this->source.substr(offset, 1);
                size_t position = offset + 1;
                while (position < this->source.size() && position <= offset + digits &&
                       std::isxdigit(static_cast<unsigned char>(this->source[position])))
                    sequence += this->source[position++];
                return {sequence + this->codePointAt(position)};
            }
            return std::move(error.arguments);
        }

        // Fluent sources are UTF-8. Returns the offset of the first invalid sequence.
        std::optional<size_t> findInvalidUtf8(const std::string &contents) {
            const char *text = contents.data();
            int32_t length = static_cast<int32_t>(contents.size());
            int32_t position = 0;
            while (position < length) {
                int32_t start = position;
                UChar32 codePoint;
                U8_NEXT(text, position, length, codePoint);
                if (codePoint < 0)
                    return static_cast<size_t>(start);
            }
            return std::nullopt;
        }
    } // namespace

    ParseError makeParseError(const std::string &contents, const std::vector<ast::Junk> &junk) {
        std::vector<Diagnostic> diagnostics;
        for (const ast::Junk &entry : junk) {
            Diagnostic diagnostic;
            diagnostic.code = entry.code;
            diagnostic.message = entry.getMessage();
            diagnostic.offset = entry.offset;
            auto position = lineColumn(contents, entry.offset);
            diagnostic.line = position.first;
            diagnostic.column = position.second;
            diagnostic.snippet = entry.value;
            diagnostics.push_back(std::move(diagnostic));
        }
        return ParseError(std::move(diagnostics));
    }

    std::vector<ast::Entry> parse(const std::string &contents, bool strict) {
        if (auto invalid = findInvalidUtf8(contents)) {
            ast::Junk junk(contents.substr(*invalid, 16), "E0001",
                           {"invalid UTF-8 sequence"}, *invalid);
            throw makeParseError(contents, {junk});
        }

        std::vector<ast::Entry> entries = ResourceParser(contents).getResource();

        if (strict) {
            std::vector<ast::Junk> junk;
            for (const ast::Entry &entry : entries) {
                if (auto *value = std::get_if<ast::Junk>(&entry))
                    junk.push_back(*value);
            }
            if (!junk.empty())
                throw makeParseError(contents, junk);
        }
        return entries;
    }

    std::vector<ast::Entry> parseFile(const std::filesystem::path &filename, bool strict) {
        std::ifstream ifs(filename, std::ios::binary);
        if (!ifs)
            throw FluentError("Unable to open fluent resource " + filename.string());
        std::string content((std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>()));
        return parse(content, strict);
    }

} // namespace fluentstore
