#include "semantic_chunker/document_loader.h"
#include "semantic_chunker/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace semantic_chunker {

namespace {

// The extractor has written both {page_number, file_name} and {page, file}
PageInfo parse_page_entry(const nlohmann::json& entry, size_t index) {
    if (!entry.is_object()) {
        throw std::runtime_error("metadata.json: page entry " + std::to_string(index) +
                                 " is not an object");
    }

    PageInfo page;
    if (entry.contains("page_number") && entry["page_number"].is_number_integer()) {
        page.page_number = entry["page_number"].get<int>();
    } else if (entry.contains("page") && entry["page"].is_number_integer()) {
        page.page_number = entry["page"].get<int>();
    } else {
        throw std::runtime_error("metadata.json: page entry " + std::to_string(index) +
                                 " has no page number");
    }

    if (entry.contains("file_name") && entry["file_name"].is_string()) {
        page.file_name = entry["file_name"].get<std::string>();
    } else if (entry.contains("file") && entry["file"].is_string()) {
        page.file_name = entry["file"].get<std::string>();
    }
    if (page.file_name.empty()) {
        throw std::runtime_error("metadata.json: page entry " + std::to_string(index) +
                                 " has no file name");
    }
    return page;
}

std::string document_name(const nlohmann::json& metadata, const fs::path& input_dir) {
    if (metadata.contains("file") && metadata["file"].is_string()) {
        std::string stem = fs::path(metadata["file"].get<std::string>()).stem().string();
        if (!stem.empty()) {
            return stem;
        }
    }
    fs::path dir = input_dir;
    if (!dir.has_filename()) {
        dir = dir.parent_path();
    }
    return dir.filename().string();
}

} // namespace

DocumentManifest load_manifest(const fs::path& input_dir) {
    if (!fs::is_directory(input_dir)) {
        throw std::runtime_error("Input directory not found: " + input_dir.string());
    }

    fs::path metadata_path = input_dir / "metadata.json";
    std::ifstream file(metadata_path);
    if (!file) {
        throw std::runtime_error("metadata.json not found in " + input_dir.string());
    }

    nlohmann::json metadata;
    try {
        file >> metadata;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + metadata_path.string() + ": " + e.what());
    }

    if (!metadata.is_object() || !metadata.contains("pages") || !metadata["pages"].is_array()) {
        throw std::runtime_error("metadata.json: missing \"pages\" array");
    }

    DocumentManifest manifest;
    manifest.input_dir = input_dir;
    manifest.name = document_name(metadata, input_dir);

    const auto& pages = metadata["pages"];
    for (size_t i = 0; i < pages.size(); ++i) {
        manifest.pages.push_back(parse_page_entry(pages[i], i));
    }
    std::stable_sort(manifest.pages.begin(), manifest.pages.end(),
                     [](const PageInfo& a, const PageInfo& b) { return a.page_number < b.page_number; });

    SEMANTIC_CHUNKER_DEBUG << "Loaded metadata for '" << manifest.name << "' ("
                           << manifest.pages.size() << " pages)";
    return manifest;
}

std::string read_page_text(const fs::path& input_dir, const PageInfo& page) {
    fs::path page_path = input_dir / "pages" / page.file_name;
    std::ifstream file(page_path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Page file not found: " + page_path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<PageText> load_pages(const DocumentManifest& manifest) {
    std::vector<PageText> pages;
    pages.reserve(manifest.pages.size());
    for (const auto& info : manifest.pages) {
        pages.push_back({info, read_page_text(manifest.input_dir, info)});
    }
    return pages;
}

} // namespace semantic_chunker
