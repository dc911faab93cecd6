#include "semantic_chunker/section_parser.h"
#include "semantic_chunker/logger.h"
#include "semantic_chunker/patterns.h"

#include <algorithm>

namespace semantic_chunker {

namespace {

enum class ParseState {
    Scanning,
    InList
};

class SectionParser {
public:
    SectionParser(const std::string& text, const std::vector<ProtectedRegion>& regions)
        : text_(text), regions_(regions) {}

    std::vector<SemanticSection> run() {
        while (cursor_ < text_.size()) {
            skip_passed_regions();

            if (next_region_ < regions_.size() && regions_[next_region_].start == cursor_) {
                emit_region(regions_[next_region_]);
                ++next_region_;
                continue;
            }

            size_t line_start = cursor_;
            std::string line = read_line();

            if (in_comment_) {
                in_comment_ = !closes_html_comment(line);
                continue;
            }
            if (is_blank(line)) {
                continue;
            }
            if (opens_html_comment(line)) {
                size_t open = line.find("<!--");
                in_comment_ = !closes_html_comment(std::string_view(line).substr(open + 4));
                continue;
            }

            if (auto header = match_header(line)) {
                handle_header(*header, line_start);
            } else if (is_list_item(line)) {
                if (state_ == ParseState::Scanning) {
                    state_ = ParseState::InList;
                    list_start_ = line_start;
                }
                list_buffer_ += line;
                list_buffer_ += '\n';
            } else {
                flush_list();
                emit(SectionKind::Text, line, line_start, cursor_);
            }
        }

        flush_list();
        return std::move(sections_);
    }

private:
    // Regions that start before the cursor can only come from malformed input
    // (regions that overlap); they are skipped rather than emitted twice.
    void skip_passed_regions() {
        while (next_region_ < regions_.size() && regions_[next_region_].start < cursor_) {
            SEMANTIC_CHUNKER_DEBUG << "    Skipping region at " << regions_[next_region_].start
                                   << " behind cursor " << cursor_;
            ++next_region_;
        }
    }

    // Reads up to the next newline without running into a protected region
    std::string read_line() {
        size_t limit = text_.size();
        if (next_region_ < regions_.size()) {
            limit = std::min(limit, regions_[next_region_].start);
        }

        size_t newline = text_.find('\n', cursor_);
        bool at_newline = newline != std::string::npos && newline < limit;
        size_t line_end = at_newline ? newline : limit;

        std::string line = text_.substr(cursor_, line_end - cursor_);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        cursor_ = at_newline ? line_end + 1 : line_end;
        return line;
    }

    void handle_header(const HeaderMatch& header, size_t line_start) {
        flush_list();

        if (header.level == 1 && is_page_artifact(header.title)) {
            return;
        }

        push_heading(breadcrumbs_, header.level, header.title);
        SectionKind kind = header.level <= 2 ? SectionKind::MajorHeader : SectionKind::MinorHeader;
        emit(kind, header.title, line_start, cursor_);
    }

    void emit_region(const ProtectedRegion& region) {
        flush_list();
        emit(section_kind_for(region.kind), region.raw_content, region.start, region.end);
        cursor_ = region.end;
    }

    void flush_list() {
        if (state_ != ParseState::InList) return;

        std::string content = list_buffer_;
        while (!content.empty() && content.back() == '\n') content.pop_back();
        emit(SectionKind::List, content, list_start_, cursor_);

        list_buffer_.clear();
        state_ = ParseState::Scanning;
    }

    void emit(SectionKind kind, std::string content, size_t start, size_t end) {
        SemanticSection section;
        section.kind = kind;
        section.content = std::move(content);
        section.breadcrumbs = breadcrumbs_;
        section.start = start;
        section.end = end;
        sections_.push_back(std::move(section));
    }

    const std::string& text_;
    const std::vector<ProtectedRegion>& regions_;

    size_t cursor_ = 0;
    size_t next_region_ = 0;
    ParseState state_ = ParseState::Scanning;
    bool in_comment_ = false;
    std::string list_buffer_;
    size_t list_start_ = 0;
    Breadcrumbs breadcrumbs_;
    std::vector<SemanticSection> sections_;
};

} // namespace

void push_heading(Breadcrumbs& breadcrumbs, int level, const std::string& title) {
    if (level <= 1) {
        breadcrumbs.clear();
    } else if (breadcrumbs.size() > static_cast<size_t>(level - 1)) {
        breadcrumbs.resize(level - 1);
    }
    breadcrumbs.push_back(title);
}

std::vector<SemanticSection> parse_sections(const std::string& text,
                                            const std::vector<ProtectedRegion>& regions) {
    auto sections = SectionParser(text, regions).run();
    SEMANTIC_CHUNKER_DEBUG << "    Parsed " << sections.size() << " semantic sections";
    return sections;
}

std::vector<SemanticSection> consolidate_paragraphs(const std::vector<SemanticSection>& sections) {
    std::vector<SemanticSection> consolidated;
    std::vector<const SemanticSection*> run;

    auto flush_run = [&]() {
        if (run.empty()) return;

        SemanticSection paragraph;
        paragraph.kind = SectionKind::Text;
        paragraph.breadcrumbs = run.front()->breadcrumbs;
        paragraph.start = run.front()->start;
        paragraph.end = run.back()->end;
        for (size_t i = 0; i < run.size(); ++i) {
            if (i > 0) paragraph.content += "\n\n";
            paragraph.content += run[i]->content;
        }
        consolidated.push_back(std::move(paragraph));
        run.clear();
    };

    for (const auto& section : sections) {
        if (section.kind == SectionKind::Text && !is_list_item(section.content)) {
            run.push_back(&section);
            continue;
        }
        flush_run();
        consolidated.push_back(section);
    }
    flush_run();

    return consolidated;
}

} // namespace semantic_chunker
