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
 *  \file ast.hpp
 *  \brief Elements of the AST used to store fluent resources in memory
 */

#ifndef FLUENTSTORE_AST_HPP_INCLUDED
#define FLUENTSTORE_AST_HPP_INCLUDED

#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace fluentstore {
namespace ast {

struct Expression;

/**
 * \class StringLiteral
 * \brief A string literal enclosed in an expression, often used for escaping values
 *
 * The value is stored as written, escape sequences included, so that it can be
 * serialized again unchanged.
 *
 * E.g. { "{" }
 */
struct StringLiteral {
    std::string value;

    StringLiteral(std::string &&value) : value(std::move(value)) {}
};

/**
 * \class NumberLiteral
 * \brief A numeric decimal literal enclosed in an expression.
 *
 * The literal keeps its original spelling, including significant zeros.
 *
 * E.g.
 * - ``{ -3.14 }``
 * - ``{ 100 }``
 */
struct NumberLiteral {
    std::string value;

    NumberLiteral(std::string &&value) : value(std::move(value)) {}
};

typedef std::variant<StringLiteral, NumberLiteral> Literal;

/**
 *  \class VariableReference
 *  \brief A reference to a Variable within an expression.
 */
struct VariableReference {
    std::string identifier;
    VariableReference(std::string &&identifier) : identifier(std::move(identifier)) {}
};

/**
 *  \class MessageReference
 *  \brief A reference to a Message within an expression.
 */
struct MessageReference {
    std::string identifier;
    std::optional<std::string> attribute;
    MessageReference(std::string &&identifier, std::optional<std::string> &&attribute)
        : identifier(std::move(identifier)), attribute(std::move(attribute)) {}
};

/**
 * \class NamedArgument
 * \brief A ``name: literal`` pair passed to a function or a parameterised term
 */
struct NamedArgument {
    std::string name;
    Literal value;

    NamedArgument(std::string &&name, Literal &&value)
        : name(std::move(name)), value(std::move(value)) {}
};

/**
 * \class CallArguments
 * \brief Arguments of a FunctionReference or a parameterised TermReference
 *
 * E.g. ``($var, style: "percent")``
 */
struct CallArguments {
    std::vector<Expression> positional;
    std::vector<NamedArgument> named;
};

/**
 *  \class TermReference
 *  \brief A reference to a Term within an expression.
 *
 *  Terms may be given arguments, e.g. ``{ -brand(case: "genitive") }``
 */
struct TermReference : public MessageReference {
    std::optional<CallArguments> arguments;

    TermReference(std::string &&identifier, std::optional<std::string> &&attribute,
                  std::optional<CallArguments> &&arguments = std::nullopt)
        : MessageReference(std::move(identifier), std::move(attribute)),
          arguments(std::move(arguments)) {}
};

/**
 * \class FunctionReference
 * \brief A call to a builtin function, e.g. ``{ NUMBER($n, minimumFractionDigits: 2) }``
 *
 * Functions are never evaluated. They are kept so that they can be serialized
 * and so that references in their arguments can be found.
 */
struct FunctionReference {
    std::string identifier;
    CallArguments arguments;

    FunctionReference(std::string &&identifier, CallArguments &&arguments)
        : identifier(std::move(identifier)), arguments(std::move(arguments)) {}
};

/**
 * \class Placeable
 * \brief An expression enclosed in braces within a Pattern
 */
struct Placeable {
    // Note: this only stores one, but is easier to work with than unique_ptr
    std::vector<Expression> expression;

    Placeable(Expression &&expression);

    const Expression &get() const { return this->expression.front(); }
};

/**
 * \typedef PatternElement
 * \brief Either a run of text or a Placeable.
 *
 * Adjacent runs of text are always merged into a single element.
 */
typedef std::variant<std::string, Placeable> PatternElement;

/* Patterns are values of Messages, Terms, Attributes and Variants. */
struct Pattern {
    std::vector<PatternElement> elements;

    Pattern() = default;
    Pattern(std::vector<PatternElement> &&elements) : elements(std::move(elements)) {}
};

/**
 * \typedef VariantKey
 * \brief The key of a Variant. Either an identifier or a NumberLiteral.
 */
typedef std::variant<std::string, NumberLiteral> VariantKey;

struct Variant {
    VariantKey key;
    Pattern value;
    bool isDefault;

    Variant(VariantKey &&key, Pattern &&value, bool isDefault)
        : key(std::move(key)), value(std::move(value)), isDefault(isDefault) {}
};

/**
 * \class SelectExpression
 * \brief An expression matching against some input
 *
 * E.g. ``{ $value ->
 *   [0] No things
 *   [1] One thing
 *   *[other] Some things
 * }``
 *
 * Exactly one of the variants is the default.
 */
struct SelectExpression {
    // Note: this only stores one, see Placeable
    std::vector<Expression> selector;
    // Note Stored internally as a vector since there are usually only a small number of
    // variants and we would prefer to preserve the original ordering.
    std::vector<Variant> variants;

    SelectExpression(Expression &&selector, std::vector<Variant> &&variants);

    const Expression &getSelector() const { return this->selector.front(); }
};

struct Expression {
    typedef std::variant<StringLiteral, NumberLiteral, VariableReference, MessageReference,
                         TermReference, FunctionReference, Placeable, SelectExpression>
        Value;
    Value value;

    template <typename T, typename = std::enable_if_t<
                              !std::is_same_v<std::decay_t<T>, Expression>>>
    Expression(T &&value) : value(std::forward<T>(value)) {}
};

/**
 * \class Comment
 * \brief Data stored in a comment within a fluent resource.
 *
 * This class only stores isolated comments.
 * Comments attached to messages are embedded in the Message.
 */
struct Comment {
    std::vector<std::string> value;

    /// Lines of the comment joined by newlines
    std::string getValue() const;

    Comment(std::vector<std::string> &&value) : value(std::move(value)) {}
};

/**
 * \class GroupComment
 * \brief Data stored in a comment heading a group of messages
 *
 * GroupComments are comments which start with a ##
 */
struct GroupComment : public Comment {
    using Comment::Comment;
};

/**
 * \class ResourceComment
 * \brief Data stored in a comment heading a resource file
 *
 * ResourceComments are comments which start with ###
 */
struct ResourceComment : public Comment {
    using Comment::Comment;
};

typedef std::variant<ast::Comment, ast::GroupComment, ast::ResourceComment> AnyComment;

/**
 * \class Junk
 * \brief Unparseable data in a fluent resource.
 *
 * Junk is only kept to report the error that produced it.
 */
struct Junk {
    std::string value;
    std::string code;
    std::vector<std::string> arguments;
    /// Offset of the error within the resource
    size_t offset;

    Junk(std::string &&value, std::string &&code, std::vector<std::string> &&arguments,
         size_t offset)
        : value(std::move(value)), code(std::move(code)), arguments(std::move(arguments)),
          offset(offset) {}

    std::string getMessage() const;
};

/**
 *  \class Attribute
 *  \brief A subentity within a Message or Term.
 *
 *  Attributes cannot have their own attributes, but are otherwise functionally the same
 *  as a Message.
 */
struct Attribute {
  private:
    std::string id;
    Pattern pattern;

  public:
    inline const std::string &getId() const { return this->id; }
    inline const Pattern &getPattern() const { return this->pattern; }

    Attribute(std::string &&id, Pattern &&pattern)
        : id(std::move(id)), pattern(std::move(pattern)) {}
};

/**
 *  \class Message
 *  \brief The core localisation unit of fluent.
 *
 *  Each message has an identifier and a pattern, and may have additional attributes.
 *  A Message needs at least one of the two.
 */
class Message {
  protected:
    std::optional<Comment> comment;
    std::string id;
    std::optional<Pattern> pattern;
    std::vector<Attribute> attributes;

  public:
    inline void setComment(Comment &&comment) { this->comment = std::move(comment); }
    inline const std::optional<Comment> &getComment() const { return this->comment; }

    inline const std::string &getId() const { return this->id; }
    inline const std::optional<Pattern> &getPattern() const { return this->pattern; }
    inline const std::vector<Attribute> &getAttributes() const { return this->attributes; }

    Message(std::string &&id, std::optional<Pattern> &&pattern,
            std::vector<Attribute> &&attributes = std::vector<Attribute>(),
            std::optional<Comment> &&comment = std::optional<Comment>())
        : comment(std::move(comment)), id(std::move(id)), pattern(std::move(pattern)),
          attributes(std::move(attributes)) {}
};

/**
 *  \class Term
 *  \brief A Message for internal use within fluent resources
 *
 *  Terms when defined prefix their identifiers with ``-`` and can only be referenced
 *  within other terms and messages. The stored identifier does not include the ``-``.
 *  Unlike Messages, Terms always have a value.
 */
class Term : public Message {
    using Message::Message;
};

typedef std::variant<AnyComment, Message, Term, Junk> Entry;

} // namespace ast
} // namespace fluentstore

#endif // FLUENTSTORE_AST_HPP_INCLUDED
