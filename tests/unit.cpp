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
#include "fluentstore/identifier.hpp"
#include "fluentstore/unit.hpp"
#include "gtest/gtest.h"

using namespace fluentstore;

TEST(TestFluentUnit, ValidIds) {
    for (const auto &[type, id] : std::vector<std::pair<FluentType, std::string>>{
             {FluentType::Term, "-id"}, {FluentType::Message, "i0"}, {FluentType::Term, "-i9_8-h"}}) {
        FluentUnit unit("ok", id, "", type);
        unit.setId(id + "a");
        EXPECT_EQ(unit.getId(), id + "a");
    }
}

TEST(TestFluentUnit, InvalidIds) {
    for (const auto &[type, id] : std::vector<std::pair<FluentType, std::string>>{
             {FluentType::Term, "id"},
             {FluentType::Term, "id.a"},
             {FluentType::Term, "-id.a"},
             {FluentType::Term, "--id"},
             {FluentType::Message, "-id"},
             {FluentType::Message, "id.a"},
             {FluentType::Message, "a@"},
             {FluentType::Message, "0id"}}) {
        SCOPED_TRACE(id);
        try {
            FluentUnit unit("test", id, "", type);
            FAIL() << "Expected InvalidIdError";
        } catch (const InvalidIdError &error) {
            EXPECT_EQ(std::string(error.what()).rfind("Invalid id ", 0), 0);
        }

        std::string okId = type == FluentType::Term ? "-i" : "i";
        FluentUnit unit("test", okId, "", type);
        EXPECT_THROW(unit.setId(id), InvalidIdError);
        EXPECT_EQ(unit.getId(), okId);
    }
}

TEST(TestFluentUnit, TypeFromId) {
    EXPECT_EQ(FluentUnit("v", "message").getType(), FluentType::Message);
    EXPECT_EQ(FluentUnit("v", "-term").getType(), FluentType::Term);
    EXPECT_EQ(FluentUnit().getType(), FluentType::Message);
    EXPECT_TRUE(FluentUnit().isEmpty());
}

TEST(TestFluentUnit, CommentUnits) {
    FluentUnit unit("", "", "Some notes", FluentType::GroupComment);
    EXPECT_TRUE(unit.isHeader());
    EXPECT_FALSE(unit.isTranslatable());
    EXPECT_FALSE(unit.isEmpty());
    EXPECT_TRUE(unit.getPlaceholders().empty());
    EXPECT_FALSE(unit.getValue());
    // Comments cannot be given an id
    EXPECT_THROW(FluentUnit("", "id", "", FluentType::DetachedComment), InvalidIdError);
}

TEST(TestFluentUnit, TypeNames) {
    for (FluentType type : {FluentType::Message, FluentType::Term, FluentType::ResourceComment,
                            FluentType::GroupComment, FluentType::DetachedComment}) {
        EXPECT_EQ(fluentTypeFromString(toString(type)), type);
    }
    EXPECT_EQ(toString(FluentType::DetachedComment), "DetachedComment");
    EXPECT_FALSE(fluentTypeFromString("Junk"));
}

TEST(TestFluentUnit, Notes) {
    FluentUnit unit("value", "message");
    EXPECT_EQ(unit.getNotes(), "");
    EXPECT_FALSE(unit.hasNotes());
    unit.addNote("one");
    unit.addNote("two");
    EXPECT_EQ(unit.getNotes(), "one\ntwo");
    EXPECT_TRUE(unit.hasNotes());
    unit.removeNotes();
    EXPECT_EQ(unit.getNotes(), "");
    EXPECT_FALSE(unit.hasNotes());
}

TEST(TestFluentUnit, ValueAndAttributes) {
    FluentUnit unit("test content\n.first = First attribute\n.second =\nMulti\nline", "message");
    EXPECT_EQ(unit.getValue(), std::optional<std::string>("test content"));
    AttributeList expected = {{"first", "First attribute"}, {"second", "Multi\nline"}};
    EXPECT_EQ(unit.getAttributes(), expected);

    FluentUnit attributesOnly(".title = Title", "message");
    EXPECT_FALSE(attributesOnly.getValue());
    ASSERT_EQ(attributesOnly.getAttributes().size(), 1);
    EXPECT_EQ(attributesOnly.getAttributes()[0].first, "title");
}

TEST(TestFluentUnit, SetValue) {
    FluentUnit unit("old", "message");
    unit.setValue("new value", {{"a", "one"}, {"b", "two\nlines"}});
    EXPECT_EQ(unit.getSource(), "new value\n.a = one\n.b =\ntwo\nlines");
    EXPECT_EQ(unit.getValue(), std::optional<std::string>("new value"));

    unit.setValue(std::nullopt, {{"a", "one"}});
    EXPECT_EQ(unit.getSource(), ".a = one");
    unit.setTarget("target");
    EXPECT_EQ(unit.getSource(), "target");
}

TEST(TestFluentUnit, InvalidSource) {
    FluentUnit unit("{ $var", "message");
    EXPECT_THROW(unit.getValue(), SourceSyntaxError);
    EXPECT_THROW(unit.getAttributes(), SourceSyntaxError);
    EXPECT_TRUE(unit.getPlaceholders().empty());
}

TEST(TestFluentUnit, Placeholders) {
    FluentUnit unit("{ $count } of { -brand } { msg.attr }\n.attr = { $ignored }", "message");
    std::set<std::string> expected = {"$count", "-brand", "msg.attr"};
    EXPECT_EQ(unit.getPlaceholders(), expected);

    FluentUnit termUnit("{ $case ->\n   *[nom] { -other }\n    [gen] { $x }\n}", "-term");
    EXPECT_EQ(termUnit.getPlaceholders(), std::set<std::string>{"-other"});
}

TEST(TestIdentifier, MessageAndTermIds) {
    EXPECT_TRUE(isValidId(FluentType::Message, "hello-world_2"));
    EXPECT_FALSE(isValidId(FluentType::Message, ""));
    EXPECT_FALSE(isValidId(FluentType::Message, "_x"));
    EXPECT_TRUE(isValidId(FluentType::Term, "-brand"));
    EXPECT_FALSE(isValidId(FluentType::Term, "-"));
    EXPECT_TRUE(isValidId(FluentType::ResourceComment, ""));
    EXPECT_FALSE(isValidId(FluentType::ResourceComment, "a"));
}

TEST(TestIdentifier, FunctionNames) {
    EXPECT_TRUE(isValidFunctionName("NUMBER"));
    EXPECT_TRUE(isValidFunctionName("DATE-TIME_2"));
    EXPECT_FALSE(isValidFunctionName("number"));
    EXPECT_FALSE(isValidFunctionName("2NUMBER"));
    EXPECT_FALSE(isValidFunctionName(""));
}
