#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <txtarx/txtarx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <archive.txtar> <output_dir> [--include-snippets]\n";
    return 1;
  }

  const bool includeSnippets = argc > 3 && std::strcmp(argv[3], "--include-snippets") == 0;

  txtarx::Error error;
  txtarx::Decoder decoder;
  auto archive = decoder.decodeFile(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  // Fold edit files into their targets before writing anything
  auto patched = txtarx::applyEditFiles(*archive, &error);
  if (!patched) {
    std::cerr << "Error: " << error.message << "\n";
    return 1;
  }

  std::filesystem::path outputDir = argv[2];
  std::filesystem::create_directories(outputDir);

  int extractedCount = 0;
  for (const auto &file : patched->files()) {
    if (file.snippetRef && !includeSnippets) {
      std::cout << "Skipped snippet: " << file.name << "\n";
      continue;
    }

    auto outputPath = txtarx::resolveExtractPath(outputDir, file.name);
    if (!outputPath) {
      std::cerr << "Skipped unsafe path: " << file.name << "\n";
      continue;
    }
    std::filesystem::create_directories(outputPath->parent_path());

    std::ofstream out(*outputPath, std::ios::binary);
    out.write(reinterpret_cast<const char *>(file.data.data()),
              static_cast<std::streamsize>(file.data.size()));
    if (!out) {
      std::cerr << "Failed to extract " << file.name << "\n";
      continue;
    }
    ++extractedCount;
  }

  std::cout << "Extracted " << extractedCount << " files to " << outputDir << "\n";
  return 0;
}
