#include <cstring>
#include <iostream>

#include <txtarx/tags.hpp>
#include <txtarx/txtarx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.txtar> [-v]\n";
    return 1;
  }

  const bool verbose = argc > 2 && std::strcmp(argv[2], "-v") == 0;

  txtarx::Error error;
  txtarx::Decoder decoder(txtarx::DecoderOptions{.verbose = verbose ? 1 : 0});
  auto archive = decoder.decodeFile(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  if (!verbose) {
    for (const auto &file : archive->files()) {
      std::cout << file.name << "\n";
    }
    return 0;
  }

  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Files: " << archive->fileCount() << "\n";
  std::cout << "Commands: " << archive->commands().size() << "\n\n";

  for (const auto &file : archive->files()) {
    std::cout << "  " << file.name << "  " << (file.isBinary ? "binary" : "text") << "  "
              << file.data.size() << " bytes";
    if (file.snippetRef) {
      std::cout << "  " << txtarx::formatSnippetTag(*file.snippetRef);
    }
    if (file.editRef) {
      std::cout << "  " << txtarx::formatEditTag(*file.editRef) << " ("
                << file.editRef->edits.size() << " edits)";
    }
    std::cout << "\n";
  }

  for (const auto &missing : archive->validateSnippetRefs()) {
    std::cerr << "Warning: " << missing.file << " references unknown command #"
              << missing.missingCommand << "\n";
  }

  return 0;
}
