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

#include "fluentstore/ptree.hpp"

namespace pt = boost::property_tree;

namespace fluentstore {
template <class> inline constexpr bool always_false_v = false;

namespace {
pt::ptree getIdentifierTree(const std::string &name) {
    pt::ptree id;
    id.put("type", "Identifier");
    id.put("name", name);
    return id;
}

void putAttributeAccessor(pt::ptree &expression, const std::optional<std::string> &attribute) {
    if (attribute) {
        expression.add_child("attribute", getIdentifierTree(*attribute));
    } else {
        expression.put("attribute", "null");
    }
}

pt::ptree getCallArgumentsTree(const ast::CallArguments &arguments) {
    pt::ptree root, positional, named;
    root.put("type", "CallArguments");
    for (const ast::Expression &argument : arguments.positional) {
        positional.push_back(std::make_pair("", getPropertyTree(argument)));
    }
    for (const ast::NamedArgument &argument : arguments.named) {
        pt::ptree namedArgument;
        namedArgument.put("type", "NamedArgument");
        namedArgument.add_child("name", getIdentifierTree(argument.name));
        namedArgument.add_child(
            "value", std::visit([](const auto &literal) { return getPropertyTree(literal); },
                                argument.value));
        named.push_back(std::make_pair("", namedArgument));
    }
    if (positional.empty())
        root.put("positional", "");
    else
        root.add_child("positional", positional);
    if (named.empty())
        root.put("named", "");
    else
        root.add_child("named", named);
    return root;
}

pt::ptree getVariantTree(const ast::Variant &variant) {
    pt::ptree root;
    root.put("type", "Variant");
    std::visit(
        [&root](const auto &key) {
            using T = std::decay_t<decltype(key)>;
            if constexpr (std::is_same_v<T, std::string>) {
                root.add_child("key", getIdentifierTree(key));
            } else if constexpr (std::is_same_v<T, ast::NumberLiteral>) {
                pt::ptree number;
                number.put("type", "NumberLiteral");
                number.put("value", key.value);
                root.add_child("key", number);
            } else
                static_assert(always_false_v<T>, "non-exhaustive visitor!");
        },
        variant.key);
    root.add_child("value", getPropertyTree(variant.value));
    root.put("default", variant.isDefault ? "true" : "false");
    return root;
}

pt::ptree getCommentTree(const char *type, const ast::Comment &comment) {
    pt::ptree root;
    root.put("type", type);
    root.put("content", comment.getValue());
    return root;
}

pt::ptree getMessageTree(const char *type, const ast::Message &message) {
    pt::ptree root;
    root.put("type", type);
    root.add_child("id", getIdentifierTree(message.getId()));
    if (message.getPattern()) {
        root.add_child("value", getPropertyTree(*message.getPattern()));
    } else {
        root.put("value", "null");
    }
    if (message.getAttributes().empty()) {
        root.put("attributes", "");
    } else {
        pt::ptree attributes;
        for (const ast::Attribute &attribute : message.getAttributes()) {
            pt::ptree attributeTree;
            attributeTree.put("type", "Attribute");
            attributeTree.add_child("id", getIdentifierTree(attribute.getId()));
            attributeTree.add_child("value", getPropertyTree(attribute.getPattern()));
            attributes.push_back(std::make_pair("", attributeTree));
        }
        root.add_child("attributes", attributes);
    }
    if (message.getComment()) {
        root.add_child("comment", getCommentTree("Comment", *message.getComment()));
    } else {
        root.put("comment", "null");
    }
    return root;
}
} // namespace

pt::ptree getPropertyTree(const ast::Expression &expression) {
    pt::ptree root;
    std::visit(
        [&root](const auto &arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, ast::StringLiteral>) {
                root.put("type", "StringLiteral");
                root.put("value", arg.value);
            } else if constexpr (std::is_same_v<T, ast::NumberLiteral>) {
                root.put("type", "NumberLiteral");
                root.put("value", arg.value);
            } else if constexpr (std::is_same_v<T, ast::VariableReference>) {
                root.put("type", "VariableReference");
                root.add_child("id", getIdentifierTree(arg.identifier));
            } else if constexpr (std::is_same_v<T, ast::MessageReference>) {
                root.put("type", "MessageReference");
                root.add_child("id", getIdentifierTree(arg.identifier));
                putAttributeAccessor(root, arg.attribute);
            } else if constexpr (std::is_same_v<T, ast::TermReference>) {
                root.put("type", "TermReference");
                root.add_child("id", getIdentifierTree(arg.identifier));
                putAttributeAccessor(root, arg.attribute);
                if (arg.arguments)
                    root.add_child("arguments", getCallArgumentsTree(*arg.arguments));
                else
                    root.put("arguments", "null");
            } else if constexpr (std::is_same_v<T, ast::FunctionReference>) {
                root.put("type", "FunctionReference");
                root.add_child("id", getIdentifierTree(arg.identifier));
                root.add_child("arguments", getCallArgumentsTree(arg.arguments));
            } else if constexpr (std::is_same_v<T, ast::Placeable>) {
                root.put("type", "Placeable");
                root.add_child("expression", getPropertyTree(arg.get()));
            } else if constexpr (std::is_same_v<T, ast::SelectExpression>) {
                root.put("type", "SelectExpression");
                root.add_child("selector", getPropertyTree(arg.getSelector()));
                pt::ptree variants;
                for (const ast::Variant &variant : arg.variants)
                    variants.push_back(std::make_pair("", getVariantTree(variant)));
                root.add_child("variants", variants);
            } else
                static_assert(always_false_v<T>, "non-exhaustive visitor!");
        },
        expression.value);
    return root;
}

pt::ptree getPropertyTree(const ast::Pattern &pattern) {
    pt::ptree value, elements;
    value.put("type", "Pattern");
    for (const ast::PatternElement &elem : pattern.elements) {
        std::visit(
            [&elements](const auto &arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    pt::ptree textElem;
                    textElem.put("type", "TextElement");
                    textElem.put("value", arg);
                    elements.push_back(std::make_pair("", textElem));
                } else if constexpr (std::is_same_v<T, ast::Placeable>) {
                    pt::ptree placeable;
                    placeable.put("type", "Placeable");
                    placeable.add_child("expression", getPropertyTree(arg.get()));
                    elements.push_back(std::make_pair("", placeable));
                } else
                    static_assert(always_false_v<T>, "non-exhaustive visitor!");
            },
            elem);
    }
    value.add_child("elements", elements);
    return value;
}

void processEntry(pt::ptree &parent, const ast::Entry &entry) {
    std::visit(
        [&parent](const auto &arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, ast::Message>) {
                parent.push_back(std::make_pair("", getMessageTree("Message", arg)));
            } else if constexpr (std::is_same_v<T, ast::Term>) {
                parent.push_back(std::make_pair("", getMessageTree("Term", arg)));
            } else if constexpr (std::is_same_v<T, ast::AnyComment>) {
                pt::ptree comment = std::visit(
                    [](const auto &arg) {
                        using C = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<C, ast::Comment>)
                            return getCommentTree("Comment", arg);
                        else if constexpr (std::is_same_v<C, ast::GroupComment>)
                            return getCommentTree("GroupComment", arg);
                        else if constexpr (std::is_same_v<C, ast::ResourceComment>)
                            return getCommentTree("ResourceComment", arg);
                        else
                            static_assert(always_false_v<C>, "non-exhaustive visitor!");
                    },
                    arg);
                parent.push_back(std::make_pair("", comment));
            } else if constexpr (std::is_same_v<T, ast::Junk>) {
                pt::ptree junk, annotation, annotations;
                junk.put("type", "Junk");
                annotation.put("type", "Annotation");
                annotation.put("code", arg.code);
                annotation.put("message", arg.getMessage());
                annotations.push_back(std::make_pair("", annotation));
                junk.add_child("annotations", annotations);
                junk.put("content", arg.value);
                parent.push_back(std::make_pair("", junk));
            } else
                static_assert(always_false_v<T>, "non-exhaustive visitor!");
        },
        entry);
}

pt::ptree getResourceTree(const std::vector<ast::Entry> &entries) {
    pt::ptree resource, body;
    resource.put("type", "Resource");
    for (const ast::Entry &entry : entries) {
        processEntry(body, entry);
    }
    if (body.empty())
        resource.put("body", "");
    else
        resource.add_child("body", body);
    return resource;
}

} // namespace fluentstore
