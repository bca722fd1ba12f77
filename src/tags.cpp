#include <format>

#include <txtarx/detector.hpp>
#include <txtarx/tags.hpp>
#include <txtarx/text.hpp>

namespace txtarx {

namespace {

constexpr std::string_view kSnippetLinePrefix = "[.snippet:";
constexpr std::string_view kSnippetHrefPrefix = "[.snippet#";
constexpr std::string_view kShorthandPrefix = "[.#";
constexpr std::string_view kEditHrefPrefix = "[.edit#";

bool isSnippetTag(std::string_view tag) {
  return tag.starts_with(kSnippetLinePrefix) || tag.starts_with(kSnippetHrefPrefix) ||
         tag.starts_with(kShorthandPrefix);
}

bool isEditTag(std::string_view tag) {
  return tag == kEditTag || tag.starts_with(kEditHrefPrefix);
}

// Strip the closing bracket off "inner]"
std::string_view stripClosing(std::string_view rest) {
  if (!rest.ends_with(']')) {
    throw ParseError(ErrorCode::MissingClosingBracket,
                     std::format("Missing closing bracket ']' in tag: {}", rest));
  }
  rest.remove_suffix(1);
  return rest;
}

size_t parseLine(std::string_view lineText) {
  size_t line = 0;
  if (!text::parseUnsigned(text::trim(lineText), line)) {
    throw ParseError(ErrorCode::InvalidLineNumber,
                     std::format("Invalid line number: '{}'", lineText));
  }
  return line;
}

// "href:line" -> (href, line)
std::pair<std::string, size_t> parseHrefLine(std::string_view inner, std::string_view tag) {
  size_t colon = inner.find(':');
  if (colon == std::string_view::npos) {
    throw ParseError(ErrorCode::InvalidTag,
                     std::format("Missing colon ':' in href:line tag: {}", tag));
  }
  return {std::string(inner.substr(0, colon)), parseLine(inner.substr(colon + 1))};
}

} // namespace

std::optional<std::string_view> markerContent(std::string_view line) {
  if (!isMarkerLine(line)) {
    return std::nullopt;
  }
  std::string_view trimmed = text::trim(line);
  return trimmed.substr(kMarkerPrefix.size(),
                        trimmed.size() - kMarkerPrefix.size() - kMarkerSuffix.size());
}

SnippetRef parseSnippetRef(std::string_view tag) {
  tag = text::trim(tag);

  SnippetRef ref;
  if (tag.starts_with(kShorthandPrefix) || tag.starts_with(kSnippetHrefPrefix)) {
    size_t prefix = tag.starts_with(kShorthandPrefix) ? kShorthandPrefix.size()
                                                      : kSnippetHrefPrefix.size();
    auto [href, line] = parseHrefLine(stripClosing(tag.substr(prefix)), tag);
    ref.commandHref = std::move(href);
    ref.line = line;
    return ref;
  }

  if (tag.starts_with(kSnippetLinePrefix)) {
    ref.line = parseLine(stripClosing(tag.substr(kSnippetLinePrefix.size())));
    return ref;
  }

  throw ParseError(ErrorCode::InvalidTag,
                   std::format("Invalid snippet tag '{}'. Expected [.snippet:N], "
                               "[.snippet#href:line] or [.#href:line]",
                               tag));
}

EditRef parseEditRef(std::string_view tag) {
  tag = text::trim(tag);

  EditRef ref;
  if (tag == kEditTag) {
    return ref;
  }

  if (tag.starts_with(kEditHrefPrefix)) {
    auto [href, line] = parseHrefLine(stripClosing(tag.substr(kEditHrefPrefix.size())), tag);
    ref.commandHref = std::move(href);
    ref.startLine = line;
    return ref;
  }

  throw ParseError(ErrorCode::InvalidTag,
                   std::format("Invalid edit tag '{}'. Expected [.edit] or [.edit#href:line]",
                               tag));
}

MarkerInfo parseNameAndTags(std::string_view nameAndTags, bool strict) {
  MarkerInfo info;

  size_t open = nameAndTags.find('[');
  info.name = std::string(text::trim(nameAndTags.substr(0, open)));
  if (open == std::string_view::npos) {
    return info;
  }

  size_t pos = open;
  while (pos < nameAndTags.size()) {
    open = nameAndTags.find('[', pos);
    std::string_view gap = nameAndTags.substr(pos, open == std::string_view::npos
                                                        ? std::string_view::npos
                                                        : open - pos);
    if (strict && !text::isBlank(gap)) {
      throw ParseError(ErrorCode::InvalidTag,
                       std::format("Unexpected text '{}' between tags of '{}'", gap, info.name));
    }
    if (open == std::string_view::npos) {
      break;
    }

    size_t close = nameAndTags.find(']', open);
    if (close == std::string_view::npos) {
      if (strict) {
        throw ParseError(ErrorCode::MissingClosingBracket,
                         std::format("Missing closing bracket ']' in tags of '{}'", info.name));
      }
      info.unknownTags.emplace_back(nameAndTags.substr(open));
      break;
    }

    std::string_view tag = nameAndTags.substr(open, close - open + 1);
    pos = close + 1;

    if (tag == kBase64Tag) {
      info.isBinary = true;
      continue;
    }

    try {
      if (isSnippetTag(tag)) {
        info.snippetRef = parseSnippetRef(tag);
        continue;
      }
      if (isEditTag(tag)) {
        info.editRef = parseEditRef(tag);
        continue;
      }
    } catch (const ParseError &) {
      if (strict) {
        throw;
      }
      info.unknownTags.emplace_back(tag);
      continue;
    }

    if (strict) {
      throw ParseError(ErrorCode::InvalidTag,
                       std::format("Unknown tag '{}' on file '{}'", tag, info.name));
    }
    info.unknownTags.emplace_back(tag);
  }

  return info;
}

std::optional<Command> parseCommand(std::string_view input) {
  constexpr std::string_view prefix = "[command:";

  input = text::trim(input);
  if (!input.starts_with(prefix)) {
    return std::nullopt;
  }

  size_t bracketEnd = input.find(']');
  if (bracketEnd == std::string_view::npos) {
    return std::nullopt;
  }

  Command cmd;
  cmd.name = std::string(text::trim(input.substr(prefix.size(), bracketEnd - prefix.size())));

  std::string_view remaining = text::trim(input.substr(bracketEnd + 1));
  if (!remaining.starts_with("(#")) {
    return std::nullopt;
  }

  size_t parenEnd = remaining.find(')');
  if (parenEnd == std::string_view::npos) {
    return std::nullopt;
  }

  cmd.href = std::string(remaining.substr(2, parenEnd - 2));
  return cmd;
}

std::vector<Command> extractCommands(std::string_view content) {
  std::vector<Command> commands;

  size_t i = 0;
  while (i < content.size()) {
    if (content[i] != '[') {
      ++i;
      continue;
    }

    // Candidate runs up to and including the first ')', never past the line end
    size_t j = i + 1;
    while (j < content.size() && content[j] != '\n') {
      ++j;
      if (content[j - 1] == ')') {
        break;
      }
    }

    if (auto cmd = parseCommand(content.substr(i, j - i))) {
      commands.push_back(std::move(*cmd));
    }
    i = j;
  }

  return commands;
}

std::string formatSnippetTag(const SnippetRef &ref) {
  if (ref.commandHref) {
    return std::format("[.snippet#{}:{}]", *ref.commandHref, ref.line);
  }
  return std::format("[.snippet:{}]", ref.line);
}

std::string formatEditTag(const EditRef &ref) {
  if (ref.commandHref && ref.startLine) {
    return std::format("[.edit#{}:{}]", *ref.commandHref, *ref.startLine);
  }
  return std::string(kEditTag);
}

} // namespace txtarx
