#include "semantic_chunker/continuation.h"
#include "semantic_chunker/chunk_builder.h"
#include "semantic_chunker/chunk_validator.h"
#include "semantic_chunker/logger.h"
#include "semantic_chunker/patterns.h"

#include <array>
#include <cctype>
#include <regex>
#include <set>

namespace semantic_chunker {

namespace {

const std::set<std::string>& continuation_words() {
    static const std::set<std::string> words = {
        "and", "or", "but", "nor", "so", "yet", "for",
        "the", "a", "an", "of", "to", "in", "on", "with", "by", "from", "at", "as",
        "that", "which", "including", "such"
    };
    return words;
}

std::string last_line(const std::string& text) {
    size_t newline = text.rfind('\n');
    return newline == std::string::npos ? text : text.substr(newline + 1);
}

std::string last_word(const std::string& text) {
    size_t end = text.size();
    size_t begin = end;
    while (begin > 0 && !std::isspace(static_cast<unsigned char>(text[begin - 1]))) --begin;
    return text.substr(begin, end - begin);
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool has_terminal_punctuation(const std::string& tail) {
    char last = tail.back();
    return last == '.' || last == '!' || last == '?' || last == ':' || ends_with(tail, "---");
}

bool ends_in_table_row(const std::string& tail) {
    std::string line = last_line(tail);
    if (line.empty() || line.back() != '|') return false;
    return line.find('|') < line.size() - 1;
}

bool starts_numbered_item(const std::string& head) {
    static const std::regex pattern("^\\d+\\.");
    return std::regex_search(head, pattern, std::regex_constants::match_continuous);
}

bool starts_bullet_item(const std::string& head) {
    static const std::regex pattern("^[-*+]\\s");
    return std::regex_search(head, pattern, std::regex_constants::match_continuous);
}

std::string excerpt(const std::string& text, size_t count, bool from_end) {
    if (text.size() <= count) return text;
    return from_end ? text.substr(text.size() - count) : text.substr(0, count);
}

} // namespace

bool ContinuationSignals::any() const {
    return conjunction || no_punctuation || numbered_list || bullet_list || table || header;
}

std::vector<std::string> ContinuationSignals::names() const {
    std::vector<std::string> result;
    if (conjunction) result.push_back("conjunction");
    if (no_punctuation) result.push_back("no_punctuation");
    if (numbered_list) result.push_back("numbered_list");
    if (bullet_list) result.push_back("bullet_list");
    if (table) result.push_back("table");
    if (header) result.push_back("header");
    return result;
}

std::string page_tail(const std::string& text) {
    std::string_view view(text);
    size_t window = static_cast<size_t>(kBoundaryWindow);
    if (view.size() > window) view.remove_prefix(view.size() - window);
    return trim(view);
}

std::string page_head(const std::string& text) {
    return trim(std::string_view(text).substr(0, static_cast<size_t>(kBoundaryWindow)));
}

ContinuationSignals detect_continuation(const std::string& tail, const std::string& head) {
    ContinuationSignals signals;
    if (tail.empty() || head.empty()) {
        return signals;
    }

    signals.conjunction = continuation_words().count(to_lower(last_word(tail))) > 0;
    signals.no_punctuation = !has_terminal_punctuation(tail);
    signals.numbered_list = starts_numbered_item(head);
    signals.bullet_list = starts_bullet_item(head);
    signals.table = ends_in_table_row(tail) && head.front() == '|';
    signals.header = is_header_line(last_line(tail));
    return signals;
}

std::optional<Chunk> merge_boundary_chunks(const Chunk& last, const Chunk& first) {
    if (last.metadata.type != ChunkType::Text || first.metadata.type != ChunkType::Text) {
        return std::nullopt;
    }

    const Breadcrumbs& breadcrumbs =
        first.metadata.breadcrumbs.size() > last.metadata.breadcrumbs.size()
            ? first.metadata.breadcrumbs
            : last.metadata.breadcrumbs;

    PageInfo page;
    page.page_number = last.metadata.page_number;
    page.file_name = last.metadata.source;

    Chunk merged = create_chunk(last.content_only + "\n\n" + first.content_only,
                                breadcrumbs, page, ChunkType::Text);
    merged.metadata.merged_from_pages = std::array<int, 2>{last.metadata.page_number,
                                                           first.metadata.page_number};
    merged.metadata.is_merged = true;

    std::string reason;
    if (!validate_chunk(merged, reason)) {
        SEMANTIC_CHUNKER_WARN << "Merged chunk failed validation: " << reason;
        return std::nullopt;
    }
    return merged;
}

void merge_across_pages(std::vector<PageChunks>& pages,
                        const ChunkOptions& options,
                        ProcessingCounters& counters) {
    if (!options.enable_merging || pages.size() < 2) {
        return;
    }

    SEMANTIC_CHUNKER_INFO << "Checking " << pages.size() - 1 << " page boundaries for continuation";

    for (size_t i = 0; i + 1 < pages.size(); ++i) {
        auto& current = pages[i];
        auto& next = pages[i + 1];

        std::string tail = page_tail(current.text);
        std::string head = page_head(next.text);

        SEMANTIC_CHUNKER_DEBUG << "  Boundary " << current.page.page_number << " -> "
                               << next.page.page_number;
        SEMANTIC_CHUNKER_DEBUG << "    Current ends: ..." << excerpt(tail, 50, true);
        SEMANTIC_CHUNKER_DEBUG << "    Next starts: " << excerpt(head, 50, false) << "...";

        auto signals = detect_continuation(tail, head);
        if (!signals.any()) {
            SEMANTIC_CHUNKER_DEBUG << "    No continuation detected";
            continue;
        }

        std::string joined;
        for (const auto& name : signals.names()) {
            counters.continuation_signals[name]++;
            if (!joined.empty()) joined += ", ";
            joined += name;
        }
        SEMANTIC_CHUNKER_DEBUG << "    Continuation detected, signals: " << joined;

        if (current.chunks.empty() || next.chunks.empty()) {
            continue;
        }

        const Chunk& last = current.chunks.back();
        const Chunk& first = next.chunks.front();
        if (last.metadata.type != ChunkType::Text || first.metadata.type != ChunkType::Text) {
            SEMANTIC_CHUNKER_DEBUG << "    Boundary chunk is " << to_string(last.metadata.type) << "/"
                                   << to_string(first.metadata.type) << ", keeping both";
            continue;
        }

        auto merged = merge_boundary_chunks(last, first);
        if (!merged) {
            counters.validation_failures++;
            continue;
        }

        size_t before = current.chunks.size() + next.chunks.size();
        current.chunks.back() = std::move(*merged);
        next.chunks.erase(next.chunks.begin());
        counters.merged_boundaries++;

        SEMANTIC_CHUNKER_INFO << "Merged pages " << current.page.page_number << "-"
                              << next.page.page_number << ": " << before << " -> "
                              << before - 1 << " chunks (-1)";
    }
}

} // namespace semantic_chunker
