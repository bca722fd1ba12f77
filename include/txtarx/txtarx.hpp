#pragma once

// txtarx - text archive library
// A C++20 library for the extended txtar format: many files, optionally
// binary (base64), packed into one plain-text document together with a
// comment, command links, snippet references and SEARCH/REPLACE edit files.

#include "archive.hpp"
#include "decoder.hpp"
#include "detector.hpp"
#include "edit.hpp"
#include "encoder.hpp"
#include "filesystem.hpp"
#include "types.hpp"

// The library is organised in layers:
//
// 1. Model: File / Archive, with detectEncoding() choosing text or base64
//    for each file
//
// 2. Codec: Decoder / Encoder
//    - Decoder::decode() parses text into an Archive, including edit programs
//    - Encoder::encode() writes an Archive back to text
//
// 3. Edits: parseEditBlocks() / applyEdits() / applyEditFiles()
//
// Example usage:
//
//   // Building and encoding an archive
//   txtarx::Archive archive("Fix bundle\n[command: rg](#search1)\n");
//   archive.parseCommands();
//   archive.addFile(txtarx::File::create("src/main.cpp", "int main() {}\n"));
//   auto text = txtarx::Encoder().encode(archive);
//
//   // Decoding and applying edit files
//   txtarx::Error error;
//   txtarx::Decoder decoder;
//   auto decoded = decoder.decode(*text, &error);
//   if (decoded) {
//     auto patched = txtarx::applyEditFiles(*decoded, &error);
//   }

namespace txtarx {}
