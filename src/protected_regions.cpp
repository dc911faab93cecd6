#include "semantic_chunker/protected_regions.h"
#include "semantic_chunker/logger.h"
#include "semantic_chunker/patterns.h"

#include <algorithm>
#include <cctype>

namespace semantic_chunker {

namespace {

struct LineSpan {
    size_t begin;
    size_t end;  // excludes the newline
};

std::vector<LineSpan> split_lines(const std::string& text) {
    std::vector<LineSpan> lines;
    size_t begin = 0;
    while (begin < text.size()) {
        size_t newline = text.find('\n', begin);
        size_t end = newline == std::string::npos ? text.size() : newline;
        lines.push_back({begin, end});
        if (newline == std::string::npos) break;
        begin = newline + 1;
    }
    return lines;
}

class LineView {
public:
    explicit LineView(const std::string& text) : text_(text), lines_(split_lines(text)) {}

    size_t size() const { return lines_.size(); }
    const LineSpan& span(size_t i) const { return lines_[i]; }

    std::string line(size_t i) const {
        const auto& span = lines_[i];
        std::string result = text_.substr(span.begin, span.end - span.begin);
        if (!result.empty() && result.back() == '\r') result.pop_back();
        return result;
    }

    ProtectedRegion region(size_t first, size_t last, RegionKind kind) const {
        ProtectedRegion region;
        region.kind = kind;
        region.start = lines_[first].begin;
        region.end = lines_[last].end;
        while (region.end > region.start &&
               std::isspace(static_cast<unsigned char>(text_[region.end - 1]))) {
            --region.end;
        }
        region.raw_content = text_.substr(region.start, region.end - region.start);
        return region;
    }

private:
    const std::string& text_;
    std::vector<LineSpan> lines_;
};

bool is_image_boundary(const std::string& line) {
    auto header = match_header(line);
    return (header && header->level <= 3) || is_horizontal_rule(line);
}

// Index one past the last line of the image block opened at `first`
size_t image_block_end(const LineView& lines, size_t first, ImageMarker marker) {
    size_t j = first + 1;
    for (; j < lines.size(); ++j) {
        std::string line = lines.line(j);
        if (is_image_boundary(line)) break;
        if (marker == ImageMarker::Numbered &&
            classify_image_marker(line) == ImageMarker::Numbered) {
            break;
        }
        if (marker == ImageMarker::Quoted && is_blank(line) &&
            (j + 1 >= lines.size() || !is_quote_line(lines.line(j + 1)))) {
            break;
        }
    }
    return j;
}

// Caption and summary tails stop at a blank line, a header or a sibling marker
bool ends_table_tail(const std::string& line) {
    return is_blank(line) || is_header_line(line) || is_table_row(line) ||
           is_image_marker(line) || is_table_caption(line) || is_table_summary(line);
}

size_t skip_blank_lines(const LineView& lines, size_t i) {
    while (i < lines.size() && is_blank(lines.line(i))) ++i;
    return i;
}

size_t extend_tail(const LineView& lines, size_t first) {
    size_t i = first + 1;
    while (i < lines.size() && !ends_table_tail(lines.line(i))) ++i;
    return i - 1;
}

} // namespace

std::vector<ProtectedRegion> find_image_blocks(const std::string& text) {
    std::vector<ProtectedRegion> blocks;
    LineView lines(text);

    size_t i = 0;
    while (i < lines.size()) {
        ImageMarker marker = classify_image_marker(lines.line(i));
        if (marker == ImageMarker::None) {
            ++i;
            continue;
        }

        size_t j = image_block_end(lines, i, marker);

        blocks.push_back(lines.region(i, j - 1, RegionKind::Image));
        i = j;
    }
    return blocks;
}

std::vector<ProtectedRegion> find_tables(const std::string& text) {
    std::vector<ProtectedRegion> tables;
    LineView lines(text);

    size_t i = 0;
    while (i + 2 < lines.size()) {
        if (!is_table_row(lines.line(i)) ||
            !is_table_separator(lines.line(i + 1)) ||
            !is_table_row(lines.line(i + 2))) {
            ++i;
            continue;
        }

        size_t last = i + 2;
        while (last + 1 < lines.size() && is_table_row(lines.line(last + 1))) ++last;

        size_t next = skip_blank_lines(lines, last + 1);
        if (next < lines.size() && is_table_caption(lines.line(next))) {
            last = extend_tail(lines, next);
            next = skip_blank_lines(lines, last + 1);
        }
        if (next < lines.size() && is_table_summary(lines.line(next))) {
            last = extend_tail(lines, next);
        }

        tables.push_back(lines.region(i, last, RegionKind::Table));
        i = last + 1;
    }
    return tables;
}

std::vector<ProtectedRegion> find_code_blocks(const std::string& text) {
    static const std::string fence = "```";
    std::vector<ProtectedRegion> blocks;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find(fence, pos);
        if (open == std::string::npos) break;
        size_t close = text.find(fence, open + fence.size());
        if (close == std::string::npos) break;

        ProtectedRegion block;
        block.kind = RegionKind::Code;
        block.start = open;
        block.end = close + fence.size();
        block.raw_content = text.substr(block.start, block.end - block.start);
        blocks.push_back(std::move(block));

        pos = close + fence.size();
    }
    return blocks;
}

std::vector<ProtectedRegion> merge_regions(std::vector<ProtectedRegion> matches,
                                           const std::string& text) {
    std::sort(matches.begin(), matches.end(),
              [](const ProtectedRegion& a, const ProtectedRegion& b) {
                  if (a.start != b.start) return a.start < b.start;
                  return a.end > b.end;
              });

    std::vector<ProtectedRegion> merged;
    for (auto& match : matches) {
        if (!merged.empty() && match.start < merged.back().end) {
            auto& previous = merged.back();
            if (match.end > previous.end) {
                previous.end = match.end;
                previous.raw_content = text.substr(previous.start, previous.end - previous.start);
            }
            continue;
        }
        merged.push_back(std::move(match));
    }
    return merged;
}

std::vector<ProtectedRegion> detect_protected_regions(const std::string& text) {
    auto images = find_image_blocks(text);
    auto tables = find_tables(text);
    auto code = find_code_blocks(text);

    SEMANTIC_CHUNKER_DEBUG << "    Protected matches: " << images.size() << " image, "
                           << tables.size() << " table, " << code.size() << " code";

    std::vector<ProtectedRegion> matches;
    matches.reserve(images.size() + tables.size() + code.size());
    std::move(images.begin(), images.end(), std::back_inserter(matches));
    std::move(tables.begin(), tables.end(), std::back_inserter(matches));
    std::move(code.begin(), code.end(), std::back_inserter(matches));

    size_t match_count = matches.size();
    auto regions = merge_regions(std::move(matches), text);

    if (regions.size() != match_count) {
        SEMANTIC_CHUNKER_DEBUG << "    Merged " << match_count << " matches into "
                               << regions.size() << " protected regions";
    }
    return regions;
}

} // namespace semantic_chunker
