#pragma once

#include "semantic_chunker/types.h"

#include <filesystem>
#include <string>
#include <vector>

namespace semantic_chunker {

// What metadata.json says about an extracted document
struct DocumentManifest {
    std::string name;  // stem of metadata "file", else the directory name
    std::filesystem::path input_dir;
    std::vector<PageInfo> pages;  // ordered by page_number
};

struct PageText {
    PageInfo info;
    std::string text;
};

// All of these throw std::runtime_error on missing or malformed input.
DocumentManifest load_manifest(const std::filesystem::path& input_dir);
std::string read_page_text(const std::filesystem::path& input_dir, const PageInfo& page);
std::vector<PageText> load_pages(const DocumentManifest& manifest);

} // namespace semantic_chunker
