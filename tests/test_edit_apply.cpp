#include <string>
#include <vector>

#include <txtarx/edit.hpp>

#include <gtest/gtest.h>

using txtarx::EditBlock;
using txtarx::EditOperation;
using txtarx::Error;
using txtarx::ErrorCode;

namespace {

EditBlock replaceLines(std::vector<std::string> search, std::vector<std::string> replacement) {
  return EditBlock{std::move(search), std::move(replacement), EditOperation::Replace};
}

EditBlock deleteLines(std::vector<std::string> search) {
  return EditBlock{std::move(search), {}, EditOperation::Delete};
}

EditBlock insertLines(std::vector<std::string> lines) {
  return EditBlock{{}, std::move(lines), EditOperation::Insert};
}

} // namespace

TEST(ApplyEditsTest, ReplaceSingleLine) {
  std::vector<EditBlock> edits = {replaceLines({"world"}, {"there"})};

  Error error;
  auto result = txtarx::applyEdits("hello\nworld\n", edits, &error);
  ASSERT_TRUE(result.has_value()) << error.message;
  EXPECT_EQ(*result, "hello\nthere");
}

TEST(ApplyEditsTest, ReplaceMultipleLines) {
  std::vector<EditBlock> edits = {replaceLines({"b", "c"}, {"x", "y", "z"})};

  auto result = txtarx::applyEdits("a\nb\nc\nd", edits);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "a\nx\ny\nz\nd");
}

TEST(ApplyEditsTest, DeleteLines) {
  std::vector<EditBlock> edits = {deleteLines({"b"})};

  auto result = txtarx::applyEdits("a\nb\nc", edits);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "a\nc");
}

TEST(ApplyEditsTest, InsertPrepends) {
  std::vector<EditBlock> edits = {insertLines({"#!/bin/sh", "set -e"})};

  auto result = txtarx::applyEdits("echo hi", edits);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "#!/bin/sh\nset -e\necho hi");
}

TEST(ApplyEditsTest, InsertIntoEmptyContent) {
  std::vector<EditBlock> edits = {insertLines({"first"})};

  auto result = txtarx::applyEdits("", edits);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "first");
}

TEST(ApplyEditsTest, EmptyContentRejectsOtherOperations) {
  std::vector<EditBlock> edits = {insertLines({"first"}), deleteLines({"x"})};

  Error error;
  EXPECT_FALSE(txtarx::applyEdits("", edits, &error).has_value());
  EXPECT_EQ(error.code, ErrorCode::EmptyContent);
}

TEST(ApplyEditsTest, NoEditsNormalizesLineBreaks) {
  auto result = txtarx::applyEdits("a\r\nb\n", {});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "a\nb");
}

TEST(ApplyEditsTest, SearchNotFound) {
  std::vector<EditBlock> edits = {replaceLines({"missing"}, {"x"})};

  Error error;
  EXPECT_FALSE(txtarx::applyEdits("a\nb", edits, &error).has_value());
  EXPECT_EQ(error.code, ErrorCode::SearchNotFound);
  EXPECT_NE(error.message.find("missing"), std::string::npos);
}

TEST(ApplyEditsTest, MatchIsExactPerLine) {
  // No trimming on the content side
  std::vector<EditBlock> edits = {replaceLines({"b"}, {"x"})};

  Error error;
  EXPECT_FALSE(txtarx::applyEdits("a\n  b\n", edits, &error).has_value());
  EXPECT_EQ(error.code, ErrorCode::SearchNotFound);
}

TEST(ApplyEditsTest, AppliesInOrder) {
  std::vector<EditBlock> edits = {replaceLines({"b"}, {"B"}), replaceLines({"c"}, {"C"})};

  auto result = txtarx::applyEdits("a\nb\nc", edits);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "a\nB\nC");
}

TEST(ApplyEditsTest, EditsSeeEarlierResults) {
  std::vector<EditBlock> edits = {replaceLines({"b"}, {"B"}), replaceLines({"a", "B"}, {"AB"})};

  auto result = txtarx::applyEdits("a\nb\nc", edits);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "AB\nc");
}

TEST(ApplyEditsTest, DependentEditsInReverseOrderFail) {
  std::vector<EditBlock> edits = {replaceLines({"a", "B"}, {"AB"}), replaceLines({"b"}, {"B"})};

  Error error;
  EXPECT_FALSE(txtarx::applyEdits("a\nb\nc", edits, &error).has_value());
  EXPECT_EQ(error.code, ErrorCode::SearchNotFound);
}

TEST(ApplyEditsTest, FirstMatchWins) {
  std::vector<EditBlock> edits = {replaceLines({"x"}, {"y"})};

  auto result = txtarx::applyEdits("x\nx\nx", edits);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "y\nx\nx");
}

TEST(ApplyEditsTest, RequireUniqueMatch) {
  std::vector<EditBlock> edits = {replaceLines({"x"}, {"y"})};
  txtarx::ApplyOptions options;
  options.requireUniqueMatch = true;

  Error error;
  EXPECT_FALSE(txtarx::applyEdits("x\nx", edits, &error, options).has_value());
  EXPECT_EQ(error.code, ErrorCode::MultipleMatches);
  EXPECT_NE(error.message.find("2 times"), std::string::npos) << error.message;

  auto result = txtarx::applyEdits("x\nz", edits, &error, options);
  ASSERT_TRUE(result.has_value()) << error.message;
  EXPECT_EQ(*result, "y\nz");
}

TEST(ApplyEditsTest, Deterministic) {
  std::vector<EditBlock> edits = {replaceLines({"b"}, {"B"}), insertLines({"top"}),
                                  deleteLines({"c"})};

  auto first = txtarx::applyEdits("a\nb\nc\nb", edits);
  auto second = txtarx::applyEdits("a\nb\nc\nb", edits);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, "top\na\nB\nb");
  EXPECT_EQ(*first, *second);
}

TEST(ApplyEditsTest, ParsedBlocksApply) {
  auto edits = txtarx::parseEditBlocks("<<<<<<< SEARCH\n"
                                       "fn main() {}\n"
                                       "=======\n"
                                       "fn main() {\n"
                                       "    run();\n"
                                       "}\n"
                                       ">>>>>>> REPLACE\n");
  ASSERT_TRUE(edits.has_value());

  txtarx::EditRef ref;
  ref.edits = *edits;

  auto result = ref.apply("// entry\nfn main() {}\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "// entry\nfn main() {\n    run();\n}");
}

TEST(SearchBlockTest, FindAndCount) {
  std::vector<std::string> lines = {"a", "b", "a", "b", "a"};
  std::vector<std::string> ab = {"a", "b"};
  std::vector<std::string> aba = {"a", "b", "a"};
  std::vector<std::string> none = {"c"};

  EXPECT_EQ(txtarx::findSearchBlock(lines, ab), 0u);
  EXPECT_EQ(txtarx::countMatches(lines, ab), 2u);
  EXPECT_EQ(txtarx::countMatches(lines, aba), 2u); // Overlapping
  EXPECT_FALSE(txtarx::findSearchBlock(lines, none).has_value());
  EXPECT_FALSE(txtarx::findSearchBlock(lines, {}).has_value());
  EXPECT_EQ(txtarx::countMatches(ab, lines), 0u);
}
