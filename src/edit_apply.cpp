#include <algorithm>
#include <format>

#include <txtarx/edit.hpp>
#include <txtarx/text.hpp>

namespace txtarx {

namespace {

bool matchesAt(std::span<const std::string> lines, std::span<const std::string> search,
               size_t start) {
  return std::equal(search.begin(), search.end(), lines.begin() + start);
}

std::string describeSearch(std::span<const std::string> search) {
  return search.empty() ? std::string("(empty)") : text::joinLines(search);
}

} // namespace

std::optional<size_t> findSearchBlock(std::span<const std::string> lines,
                                      std::span<const std::string> search) {
  if (search.empty() || search.size() > lines.size()) {
    return std::nullopt;
  }

  for (size_t start = 0; start + search.size() <= lines.size(); ++start) {
    if (matchesAt(lines, search, start)) {
      return start;
    }
  }
  return std::nullopt;
}

size_t countMatches(std::span<const std::string> lines, std::span<const std::string> search) {
  if (search.empty() || search.size() > lines.size()) {
    return 0;
  }

  size_t count = 0;
  for (size_t start = 0; start + search.size() <= lines.size(); ++start) {
    if (matchesAt(lines, search, start)) {
      ++count;
    }
  }
  return count;
}

std::optional<std::string> applyEdits(std::string_view content, std::span<const EditBlock> edits,
                                      Error *outError, const ApplyOptions &options) {
  if (content.empty()) {
    for (size_t i = 0; i < edits.size(); ++i) {
      if (edits[i].operation != EditOperation::Insert) {
        setError(outError, ErrorCode::EmptyContent,
                 std::format("Cannot apply {} edit #{} to empty content",
                             editOperationName(edits[i].operation), i + 1));
        return std::nullopt;
      }
    }
  }

  std::vector<std::string> lines;
  for (auto line : text::splitLines(content)) {
    lines.emplace_back(line);
  }

  for (const auto &edit : edits) {
    // An empty search on a Replace also prepends
    if (edit.operation == EditOperation::Insert ||
        (edit.operation == EditOperation::Replace && edit.search.empty())) {
      lines.insert(lines.begin(), edit.replacement.begin(), edit.replacement.end());
      continue;
    }

    auto start = findSearchBlock(lines, edit.search);
    if (!start) {
      setError(outError, ErrorCode::SearchNotFound,
               std::format("Search pattern not found: '{}'", describeSearch(edit.search)));
      return std::nullopt;
    }

    if (options.requireUniqueMatch) {
      size_t count = countMatches(lines, edit.search);
      if (count > 1) {
        setError(outError, ErrorCode::MultipleMatches,
                 std::format("Search pattern found {} times (ambiguous): '{}'", count,
                             describeSearch(edit.search)));
        return std::nullopt;
      }
    }

    auto first = lines.begin() + static_cast<std::ptrdiff_t>(*start);
    auto last = first + static_cast<std::ptrdiff_t>(edit.search.size());
    first = lines.erase(first, last);

    if (edit.operation == EditOperation::Replace) {
      lines.insert(first, edit.replacement.begin(), edit.replacement.end());
    }
  }

  return text::joinLines(lines);
}

std::optional<std::string> EditRef::apply(std::string_view content, Error *outError) const {
  return applyEdits(content, edits, outError);
}

} // namespace txtarx
