#include <string>

#include <txtarx/tags.hpp>

#include <gtest/gtest.h>

using txtarx::ErrorCode;
using txtarx::ParseError;

namespace {

ErrorCode snippetErrorCode(std::string_view tag) {
  try {
    txtarx::parseSnippetRef(tag);
  } catch (const ParseError &e) {
    return e.code();
  }
  return ErrorCode::None;
}

} // namespace

// Snippet references

TEST(SnippetRefTest, LineOnly) {
  auto ref = txtarx::parseSnippetRef("[.snippet:42]");
  EXPECT_FALSE(ref.commandHref.has_value());
  EXPECT_EQ(ref.line, 42u);
}

TEST(SnippetRefTest, FullHref) {
  auto ref = txtarx::parseSnippetRef("[.snippet#search1:10]");
  EXPECT_EQ(ref.commandHref, "search1");
  EXPECT_EQ(ref.line, 10u);
}

TEST(SnippetRefTest, ShorthandHref) {
  auto ref = txtarx::parseSnippetRef("[.#search1:10]");
  EXPECT_EQ(ref.commandHref, "search1");
  EXPECT_EQ(ref.line, 10u);
}

TEST(SnippetRefTest, Errors) {
  EXPECT_EQ(snippetErrorCode("invalid"), ErrorCode::InvalidTag);
  EXPECT_EQ(snippetErrorCode(".snippet:42"), ErrorCode::InvalidTag);
  EXPECT_EQ(snippetErrorCode("search1:10"), ErrorCode::InvalidTag);
  EXPECT_EQ(snippetErrorCode("[.snippet:42"), ErrorCode::MissingClosingBracket);
  EXPECT_EQ(snippetErrorCode("[.#search1]"), ErrorCode::InvalidTag);
  EXPECT_EQ(snippetErrorCode("[.snippet:abc]"), ErrorCode::InvalidLineNumber);
  EXPECT_EQ(snippetErrorCode("[.#href:-1]"), ErrorCode::InvalidLineNumber);
}

TEST(SnippetRefTest, FormatTag) {
  EXPECT_EQ(txtarx::formatSnippetTag({std::nullopt, 7}), "[.snippet:7]");
  EXPECT_EQ(txtarx::formatSnippetTag({"cmd", 3}), "[.snippet#cmd:3]");
}

// Edit references

TEST(EditRefTagTest, Plain) {
  auto ref = txtarx::parseEditRef("[.edit]");
  EXPECT_FALSE(ref.commandHref.has_value());
  EXPECT_FALSE(ref.startLine.has_value());
  EXPECT_TRUE(ref.edits.empty());
}

TEST(EditRefTagTest, WithHref) {
  auto ref = txtarx::parseEditRef("[.edit#cmd1:42]");
  EXPECT_EQ(ref.commandHref, "cmd1");
  EXPECT_EQ(ref.startLine, 42u);
}

TEST(EditRefTagTest, MalformedThrows) {
  EXPECT_THROW(txtarx::parseEditRef("[.edit#cmd1]"), ParseError);
  EXPECT_THROW(txtarx::parseEditRef("[.editor]"), ParseError);
}

TEST(EditRefTagTest, FormatTag) {
  txtarx::EditRef ref;
  EXPECT_EQ(txtarx::formatEditTag(ref), "[.edit]");

  ref.commandHref = "cmd1";
  EXPECT_EQ(txtarx::formatEditTag(ref), "[.edit]");
  EXPECT_NO_THROW(txtarx::parseEditRef(txtarx::formatEditTag(ref)));

  ref.startLine = 42;
  EXPECT_EQ(txtarx::formatEditTag(ref), "[.edit#cmd1:42]");
}

// Marker parsing

TEST(MarkerTest, MarkerContent) {
  EXPECT_EQ(txtarx::markerContent("-- f.txt --"), "f.txt");
  EXPECT_EQ(txtarx::markerContent("  -- a b --  "), "a b");
  EXPECT_FALSE(txtarx::markerContent("--   --").has_value());
  EXPECT_FALSE(txtarx::markerContent("hello").has_value());
}

TEST(MarkerTest, NameWithoutTags) {
  auto info = txtarx::parseNameAndTags(" dir/sub/file.txt ");
  EXPECT_EQ(info.name, "dir/sub/file.txt");
  EXPECT_FALSE(info.isBinary);
  EXPECT_FALSE(info.snippetRef.has_value());
  EXPECT_FALSE(info.editRef.has_value());
}

TEST(MarkerTest, CombinedTags) {
  auto info = txtarx::parseNameAndTags("image.jpg[.base64][.snippet:100]");
  EXPECT_EQ(info.name, "image.jpg");
  EXPECT_TRUE(info.isBinary);
  ASSERT_TRUE(info.snippetRef.has_value());
  EXPECT_EQ(info.snippetRef->line, 100u);
  EXPECT_TRUE(info.unknownTags.empty());
}

TEST(MarkerTest, TagOrderDoesNotMatter) {
  auto info = txtarx::parseNameAndTags("a.txt[.edit#c:1][.base64]");
  EXPECT_TRUE(info.isBinary);
  ASSERT_TRUE(info.editRef.has_value());
  EXPECT_EQ(info.editRef->commandHref, "c");
}

TEST(MarkerTest, UnknownTagsAreSkipped) {
  auto info = txtarx::parseNameAndTags("a.txt[.future][.snippet:x][.base64]");
  EXPECT_EQ(info.name, "a.txt");
  EXPECT_TRUE(info.isBinary);
  EXPECT_FALSE(info.snippetRef.has_value());
  ASSERT_EQ(info.unknownTags.size(), 2u);
  EXPECT_EQ(info.unknownTags[0], "[.future]");
  EXPECT_EQ(info.unknownTags[1], "[.snippet:x]");
}

TEST(MarkerTest, UnclosedBracketIsTolerated) {
  auto info = txtarx::parseNameAndTags("a.txt[.base64");
  EXPECT_EQ(info.name, "a.txt");
  EXPECT_FALSE(info.isBinary);
}

TEST(MarkerTest, StrictModeRejectsUnknownTags) {
  try {
    txtarx::parseNameAndTags("a.txt[.future]", true);
    FAIL() << "Expected ParseError";
  } catch (const ParseError &e) {
    EXPECT_EQ(e.code(), ErrorCode::InvalidTag);
  }

  try {
    txtarx::parseNameAndTags("a.txt[.base64", true);
    FAIL() << "Expected ParseError";
  } catch (const ParseError &e) {
    EXPECT_EQ(e.code(), ErrorCode::MissingClosingBracket);
  }

  EXPECT_THROW(txtarx::parseNameAndTags("a.txt[.snippet:x]", true), ParseError);
  EXPECT_NO_THROW(txtarx::parseNameAndTags("a.txt[.base64][.edit]", true));
}

// Commands

TEST(CommandTest, Simple) {
  auto cmd = txtarx::parseCommand("[command: rg](#search1)");
  ASSERT_TRUE(cmd.has_value());
  EXPECT_EQ(cmd->name, "rg");
  EXPECT_EQ(cmd->href, "search1");
}

TEST(CommandTest, NameIsTrimmed) {
  auto cmd = txtarx::parseCommand("[command: rg ](#search2)");
  ASSERT_TRUE(cmd.has_value());
  EXPECT_EQ(cmd->name, "rg");
}

TEST(CommandTest, NameWithSpaces) {
  auto cmd = txtarx::parseCommand("[command: git diff](#change1)");
  ASSERT_TRUE(cmd.has_value());
  EXPECT_EQ(cmd->name, "git diff");
  EXPECT_EQ(cmd->href, "change1");
}

TEST(CommandTest, Invalid) {
  EXPECT_FALSE(txtarx::parseCommand("[command: rg]").has_value());
  EXPECT_FALSE(txtarx::parseCommand("[command: rg](search1)").has_value());
  EXPECT_FALSE(txtarx::parseCommand("[link](#x)").has_value());
  EXPECT_FALSE(txtarx::parseCommand("[command: rg](#unterminated").has_value());
}

TEST(CommandTest, ExtractFromText) {
  auto commands = txtarx::extractCommands("Fixes:\n"
                                          "[command: rg](#search1) and [command: sed](#edit1)\n"
                                          "see [docs](#x)\n"
                                          "[command: git diff](#change1)");
  ASSERT_EQ(commands.size(), 3u);
  EXPECT_EQ(commands[0], (txtarx::Command{"rg", "search1"}));
  EXPECT_EQ(commands[1], (txtarx::Command{"sed", "edit1"}));
  EXPECT_EQ(commands[2], (txtarx::Command{"git diff", "change1"}));
}

TEST(CommandTest, LinksDoNotSpanLines) {
  EXPECT_TRUE(txtarx::extractCommands("[command: rg]\n(#search1)").empty());
}
