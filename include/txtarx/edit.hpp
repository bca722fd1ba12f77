#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace txtarx {

// Edit-block markers
inline constexpr std::string_view kSearchMarker = "<<<<<<< SEARCH";
inline constexpr std::string_view kSeparatorMarker = "=======";
inline constexpr std::string_view kReplaceMarker = ">>>>>>> REPLACE";
inline constexpr std::string_view kInsertMarker = ">>>>>>> INSERT";
inline constexpr std::string_view kDeleteMarker = ">>>>>>> DELETE";

// Line-by-line parser for the SEARCH/REPLACE edit language:
//
//   <<<<<<< SEARCH
//   old lines
//   =======
//   new lines
//   >>>>>>> REPLACE        (or >>>>>>> INSERT)
//
//   <<<<<<< SEARCH
//   lines to remove
//   >>>>>>> DELETE
//
// States: Start -> InSearch -> InReplace -> Start. Lines are trimmed on the
// right before they are matched or collected.
class EditParser {
public:
  enum class State { Start, InSearch, InReplace };

  EditParser() = default;

  // Feed one line. lineNumber is 1-based and only used in error messages.
  bool feed(std::string_view line, size_t lineNumber, Error *outError = nullptr);

  // Validate the final state and infer Insert operations.
  // Returns the parsed blocks and resets the parser.
  std::optional<std::vector<EditBlock>> finish(Error *outError = nullptr);

  State state() const { return state_; }

  // Blocks completed so far (operations not yet inferred)
  const std::vector<EditBlock> &blocks() const { return blocks_; }

private:
  bool onStart(std::string_view line, size_t lineNumber, Error *outError);
  void onSearch(std::string_view line);
  void onReplace(std::string_view line);
  void emit(EditOperation op);

  State state_ = State::Start;
  std::vector<std::string> search_;
  std::vector<std::string> replacement_;
  std::vector<EditBlock> blocks_;
};

// Parse a whole edit body
std::optional<std::vector<EditBlock>> parseEditBlocks(std::string_view content,
                                                      Error *outError = nullptr);

struct ApplyOptions {
  // Fail with MultipleMatches when a search block occurs more than once,
  // instead of using the first occurrence
  bool requireUniqueMatch = false;
};

// Apply edits in order to the lines of content.
//   Replace/Delete: the first exact contiguous match of the search lines is
//                   replaced or removed (SearchNotFound if none).
//   Insert:         replacement lines are prepended.
// Empty content only accepts Insert edits (EmptyContent otherwise).
// The result is joined with '\n' and has no trailing line break.
std::optional<std::string> applyEdits(std::string_view content, std::span<const EditBlock> edits,
                                      Error *outError = nullptr, const ApplyOptions &options = {});

// Offset of the first exact occurrence of search in lines, if any
std::optional<size_t> findSearchBlock(std::span<const std::string> lines,
                                      std::span<const std::string> search);

// Number of (possibly overlapping) occurrences of search in lines
size_t countMatches(std::span<const std::string> lines, std::span<const std::string> search);

} // namespace txtarx
