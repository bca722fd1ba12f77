#include <format>

#include <txtarx/edit.hpp>
#include <txtarx/text.hpp>

namespace txtarx {

bool EditParser::feed(std::string_view line, size_t lineNumber, Error *outError) {
  line = text::trimRight(line);

  switch (state_) {
  case State::Start:
    return onStart(line, lineNumber, outError);
  case State::InSearch:
    onSearch(line);
    return true;
  case State::InReplace:
    onReplace(line);
    return true;
  }
  return true;
}

bool EditParser::onStart(std::string_view line, size_t lineNumber, Error *outError) {
  if (line.starts_with(kSearchMarker)) {
    search_.clear();
    replacement_.clear();
    state_ = State::InSearch;
    return true;
  }

  if (line.starts_with("<<<<<<<")) {
    setError(outError, ErrorCode::MalformedLine,
             std::format("Malformed line at {}: '{}'", lineNumber, line));
    return false;
  }

  if (!line.empty()) {
    setError(outError, ErrorCode::ExpectedSearchStart,
             std::format("Expected {} marker at line {}, got '{}'", kSearchMarker, lineNumber,
                         line));
    return false;
  }

  return true;
}

void EditParser::onSearch(std::string_view line) {
  if (line.starts_with(kSeparatorMarker)) {
    state_ = State::InReplace;
  } else if (line.starts_with(kDeleteMarker)) {
    emit(EditOperation::Delete);
  } else {
    // Blank lines are content here
    search_.emplace_back(line);
  }
}

void EditParser::onReplace(std::string_view line) {
  if (line.starts_with(kReplaceMarker) || line.starts_with(kInsertMarker)) {
    // Provisional, Insert is inferred in finish()
    emit(EditOperation::Replace);
  } else {
    replacement_.emplace_back(line);
  }
}

void EditParser::emit(EditOperation op) {
  EditBlock block;
  block.search = std::move(search_);
  block.replacement = std::move(replacement_);
  block.operation = op;
  blocks_.push_back(std::move(block));

  search_.clear();
  replacement_.clear();
  state_ = State::Start;
}

std::optional<std::vector<EditBlock>> EditParser::finish(Error *outError) {
  if (state_ != State::Start) {
    setError(outError, ErrorCode::UnterminatedBlock,
             std::format("Unterminated edit block (missing >>>>>>> marker) after {} block(s)",
                         blocks_.size()));
    return std::nullopt;
  }

  std::vector<EditBlock> blocks = std::move(blocks_);
  blocks_.clear();

  for (size_t i = 0; i < blocks.size(); ++i) {
    auto &block = blocks[i];
    if (block.search.empty() && block.replacement.empty()) {
      setError(outError, ErrorCode::EmptyBlock,
               std::format("Empty edit block #{} (both search and replacement are empty)", i + 1));
      return std::nullopt;
    }

    if (block.operation == EditOperation::Replace && block.search.empty()) {
      block.operation = EditOperation::Insert;
    }
  }

  return blocks;
}

std::optional<std::vector<EditBlock>> parseEditBlocks(std::string_view content, Error *outError) {
  EditParser parser;

  auto lines = text::splitLines(content);
  for (size_t i = 0; i < lines.size(); ++i) {
    if (!parser.feed(lines[i], i + 1, outError)) {
      return std::nullopt;
    }
  }

  return parser.finish(outError);
}

} // namespace txtarx
