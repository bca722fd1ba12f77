#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace txtarx {

// Everything carried by a "-- name[tag][tag] --" marker line
struct MarkerInfo {
  std::string name;
  bool isBinary = false;
  std::optional<SnippetRef> snippetRef;
  std::optional<EditRef> editRef; // edits left empty, filled from the body later
  std::vector<std::string> unknownTags;
};

// Returns the text between "-- " and " --" if the trimmed line is a file marker
std::optional<std::string_view> markerContent(std::string_view line);

// Parse the name-and-tags region of a marker.
// Unknown or malformed tags are collected in unknownTags. With strict set they
// throw ParseError instead, as does a '[' without a closing ']'.
MarkerInfo parseNameAndTags(std::string_view nameAndTags, bool strict = false);

// [.snippet:N], [.snippet#href:line] or the shorthand [.#href:line]
// Throws ParseError (InvalidTag, MissingClosingBracket, InvalidLineNumber)
SnippetRef parseSnippetRef(std::string_view tag);

// [.edit] or [.edit#href:line]
// Throws ParseError (InvalidTag, MissingClosingBracket, InvalidLineNumber)
EditRef parseEditRef(std::string_view tag);

// [command: NAME](#HREF), surrounding whitespace ignored
std::optional<Command> parseCommand(std::string_view input);

// All command links in a block of text, in order of appearance.
// A link never spans lines.
std::vector<Command> extractCommands(std::string_view text);

// Marker tag text for references, e.g. "[.snippet#cmd:10]" or "[.edit]"
std::string formatSnippetTag(const SnippetRef &ref);
// An edit tag carries its href only together with a start line. The grammar
// has no href-only form, so a commandHref without startLine formats as "[.edit]".
std::string formatEditTag(const EditRef &ref);

} // namespace txtarx
