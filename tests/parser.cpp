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
#include "fluentstore/ptree.hpp"
#include "gtest/gtest.h"
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <filesystem>
#include <iostream>

namespace pt = boost::property_tree;
namespace fs = std::filesystem;
using namespace fluentstore;

class TestParser : public testing::TestWithParam<std::string> {};

namespace boost::property_tree {
void PrintTo(const pt::ptree &node, std::ostream *os) { pt::write_json(*os, node); }
} // namespace boost::property_tree

TEST_P(TestParser, ChecksParserOutput) {
    fs::path inputPath(GetParam());
    std::filesystem::path file(GetParam());
    std::vector<ast::Entry> ftl = parseFile(file);
    pt::ptree expected;
    pt::read_json(inputPath.replace_extension(".json").string(), expected);

    EXPECT_EQ(getResourceTree(ftl), expected);
}

static std::vector<std::string> collect_test_files() {
    std::vector<std::string> results;

    for (const auto &dirEntry : fs::recursive_directory_iterator("fixtures")) {
        if (dirEntry.is_regular_file()) {
            fs::path file = dirEntry.path();
            if (file.extension() == ".ftl") {
                results.push_back(file.string());
            }
        }
    }
    return results;
}
INSTANTIATE_TEST_SUITE_P(ParserTests, TestParser, testing::ValuesIn(collect_test_files()));

static const ast::Junk &getJunk(const std::vector<ast::Entry> &entries, size_t index) {
    return std::get<ast::Junk>(entries.at(index));
}

static std::string firstText(const ast::Message &message) {
    return std::get<std::string>(message.getPattern()->elements.front());
}

TEST(TestParserErrors, MissingEntryStart) {
    auto entries = parse(".floating = value\n");
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(getJunk(entries, 0).code, "E0002");
    EXPECT_EQ(getJunk(entries, 0).getMessage(), "Expected an entry start");
}

TEST(TestParserErrors, MessageWithoutValue) {
    auto entries = parse("empty =\n");
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(getJunk(entries, 0).code, "E0005");
    EXPECT_EQ(getJunk(entries, 0).getMessage(),
              "Expected message \"empty\" to have a value or attributes");
}

TEST(TestParserErrors, TermWithoutValue) {
    auto entries = parse("-term =\n    .attr = value\n");
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(getJunk(entries, 0).code, "E0006");
    EXPECT_EQ(getJunk(entries, 0).getMessage(), "Expected term \"-term\" to have a value");
}

TEST(TestParserErrors, MissingDefaultVariant) {
    std::string source = "message = { $var ->\n    [first] First\n    [second] Second\n}\n";
    auto entries = parse(source);
    ASSERT_EQ(entries.size(), 1);
    const ast::Junk &junk = getJunk(entries, 0);
    EXPECT_EQ(junk.code, "E0010");
    EXPECT_EQ(junk.value, source);
    // Reported after the last variant
    EXPECT_EQ(junk.offset, source.rfind('}'));
}

TEST(TestParserErrors, SelectorRestrictions) {
    EXPECT_EQ(getJunk(parse("m = { msg ->\n *[a] A\n}\n"), 0).code, "E0016");
    EXPECT_EQ(getJunk(parse("m = { -term ->\n *[a] A\n}\n"), 0).code, "E0017");
    EXPECT_EQ(getJunk(parse("m = { msg.attr ->\n *[a] A\n}\n"), 0).code, "E0018");
    EXPECT_EQ(getJunk(parse("m = { -term.attr }\n"), 0).code, "E0019");
    EXPECT_EQ(getJunk(parse("m = { { $x } ->\n *[a] A\n}\n"), 0).code, "E0029");
}

TEST(TestParserErrors, Variants) {
    EXPECT_EQ(getJunk(parse("m = { $x ->\n}\n"), 0).code, "E0011");
    EXPECT_EQ(getJunk(parse("m = { $x ->\n *[a] A\n *[b] B\n}\n"), 0).code, "E0015");
    EXPECT_EQ(getJunk(parse("m = { $x ->\n *[a]\n}\n"), 0).code, "E0012");
}

TEST(TestParserErrors, CallArguments) {
    EXPECT_EQ(getJunk(parse("m = { lower($x) }\n"), 0).code, "E0008");
    EXPECT_EQ(getJunk(parse("m = { F(x.y: 1) }\n"), 0).code, "E0009");
    EXPECT_EQ(getJunk(parse("m = { F(a: $x) }\n"), 0).code, "E0014");
    EXPECT_EQ(getJunk(parse("m = { F(a: 1, $x) }\n"), 0).code, "E0021");
    EXPECT_EQ(getJunk(parse("m = { F(a: 1, a: 2) }\n"), 0).code, "E0022");
}

TEST(TestParserErrors, StringLiterals) {
    EXPECT_EQ(getJunk(parse("m = { \"open\n"), 0).code, "E0020");
    auto unknown = parse("m = { \"\\q\" }\n");
    EXPECT_EQ(getJunk(unknown, 0).code, "E0025");
    EXPECT_EQ(getJunk(unknown, 0).getMessage(), "Unknown escape sequence: \\q.");
    auto unicode = parse("m = { \"\\u00ZZ\" }\n");
    EXPECT_EQ(getJunk(unicode, 0).code, "E0026");
    EXPECT_EQ(getJunk(unicode, 0).getMessage(), "Invalid Unicode escape sequence: \\u00Z.");
}

TEST(TestParserErrors, Placeables) {
    EXPECT_EQ(getJunk(parse("m = open } bracket\n"), 0).code, "E0027");
    EXPECT_EQ(getJunk(parse("m = { .5 }\n"), 0).code, "E0028");
    EXPECT_EQ(getJunk(parse("m = { -5. }\n"), 0).code, "E0004");
}

TEST(TestParserErrors, InvalidUtf8) {
    try {
        parse("m = \xff\xfe\n");
        FAIL() << "Expected ParseError";
    } catch (const ParseError &error) {
        ASSERT_EQ(error.diagnostics().size(), 1);
        EXPECT_EQ(error.diagnostics().front().code, "E0001");
        EXPECT_EQ(error.diagnostics().front().column, 5);
    }
}

TEST(TestParserRecovery, ResumesAtNextEntry) {
    auto entries = parse("a = A\nbroken = {\n  still broken\nb = B\n");
    ASSERT_EQ(entries.size(), 3);
    EXPECT_EQ(std::get<ast::Message>(entries[0]).getId(), "a");
    EXPECT_EQ(getJunk(entries, 1).value, "broken = {\n  still broken\n");
    EXPECT_EQ(std::get<ast::Message>(entries[2]).getId(), "b");
}

TEST(TestParserRecovery, StrictThrowsAllProblems) {
    try {
        parseResource("message = { -ref\nok = fine\n\n.floating = x\n");
        FAIL() << "Expected ParseError";
    } catch (const ParseError &error) {
        ASSERT_EQ(error.diagnostics().size(), 2);
        EXPECT_EQ(error.diagnostics()[0].line, 2);
        EXPECT_EQ(error.diagnostics()[1].line, 4);
        std::string what = error.what();
        EXPECT_EQ(what.rfind("Parsing error for fluent source: message = { -ref\n"
                            "E0003: Expected token: \"}\"",
                            0),
                  0);
        EXPECT_NE(what.find("\nE0002: Expected an entry start"), std::string::npos);
    }
}

TEST(TestParserComments, AttachesToFollowingMessage) {
    auto entries = parse("# A\nmessage = v\n");
    ASSERT_EQ(entries.size(), 1);
    const auto &message = std::get<ast::Message>(entries[0]);
    ASSERT_TRUE(message.getComment());
    EXPECT_EQ(message.getComment()->getValue(), "A");
}

TEST(TestParserComments, BlankLineDetaches) {
    auto entries = parse("# A\n\nmessage = v\n");
    ASSERT_EQ(entries.size(), 2);
    EXPECT_TRUE(std::holds_alternative<ast::Comment>(std::get<ast::AnyComment>(entries[0])));
    EXPECT_FALSE(std::get<ast::Message>(entries[1]).getComment());
}

TEST(TestParserComments, GroupCommentsNeverAttach) {
    auto entries = parse("## Group\n-term = v\n");
    ASSERT_EQ(entries.size(), 2);
    EXPECT_TRUE(
        std::holds_alternative<ast::GroupComment>(std::get<ast::AnyComment>(entries[0])));
    EXPECT_FALSE(std::get<ast::Term>(entries[1]).getComment());
}

TEST(TestParserComments, CommentBeforeJunkStaysStandalone) {
    auto entries = parse("# break\n.floating = yellow\n");
    ASSERT_EQ(entries.size(), 2);
    EXPECT_TRUE(std::holds_alternative<ast::AnyComment>(entries[0]));
    EXPECT_TRUE(std::holds_alternative<ast::Junk>(entries[1]));
}

TEST(TestParserPatterns, CrlfLineEndings) {
    auto entries = parse("m =\r\n    one\r\n    two\r\n");
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(firstText(std::get<ast::Message>(entries[0])), "one\ntwo");
}

TEST(TestParserPatterns, NulIsText) {
    auto entries = parse(std::string("a = x\0y\nb = z\n", 14), true);
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(firstText(std::get<ast::Message>(entries[0])), std::string("x\0y", 3));
    EXPECT_EQ(std::get<ast::Message>(entries[1]).getId(), "b");
}

TEST(TestParserPatterns, SpecialCharacterOnFirstLine) {
    auto entries = parse("m = .value\n");
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(firstText(std::get<ast::Message>(entries[0])), ".value");
}

TEST(TestParserPatterns, TrailingWhitespaceOfLastLineIsTrimmed) {
    auto entries = parse("m =  \n trailing  \n last  \n");
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(firstText(std::get<ast::Message>(entries[0])), "trailing  \nlast");
}

TEST(TestParserPatterns, StringLiteralKeepsEscapes) {
    auto entries = parse("m = { \"\\u0041\\\\\" }\n");
    ASSERT_EQ(entries.size(), 1);
    const auto &element = std::get<ast::Message>(entries[0]).getPattern()->elements.front();
    const auto &placeable = std::get<ast::Placeable>(element);
    EXPECT_EQ(std::get<ast::StringLiteral>(placeable.get().value).value, "\\u0041\\\\");
}
