#include "semantic_chunker/patterns.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace semantic_chunker {

namespace {

using std::regex;
constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

const regex& header_regex() {
    static const regex pattern("^(#{1,6})\\s+(.+?)\\s*$");
    return pattern;
}

const regex& list_item_regex() {
    static const regex pattern("^\\s*(?:[-*+]|\\d+\\.)\\s+");
    return pattern;
}


const regex& page_artifact_regex() {
    static const regex pattern("^page\\s+\\d+$", kIcase);
    return pattern;
}

const regex& horizontal_rule_regex() {
    static const regex pattern("^\\s*(?:-{3,}|\\*{3,}|_{3,})\\s*$");
    return pattern;
}

const regex& table_row_regex() {
    static const regex pattern("^\\s*\\|.*\\|\\s*$");
    return pattern;
}

const regex& table_separator_regex() {
    static const regex pattern("^\\s*\\|?\\s*:?-+:?\\s*(?:\\|\\s*:?-+:?\\s*)*\\|?\\s*$");
    return pattern;
}

const regex& table_caption_regex() {
    static const regex pattern("^\\s*\\*{0,2}\\s*Table\\s+\\d+(?:\\.\\d+)?\\s*\\*{0,2}\\s*:", kIcase);
    return pattern;
}

const regex& table_summary_regex() {
    static const regex pattern("^\\s*\\*{0,2}\\s*Table\\s+\\d+(?:\\.\\d+)?\\s+Summary\\s*\\*{0,2}\\s*:", kIcase);
    return pattern;
}

struct MarkerPattern {
    regex pattern;
    ImageMarker kind;
};

// Banner and caption conventions for visual content
const std::vector<MarkerPattern>& image_marker_patterns() {
    static const std::vector<MarkerPattern> patterns = {
        {regex("^\\s*\\*{0,2}\\s*Images?\\s+on\\s+this\\s+page", kIcase), ImageMarker::Banner},
        {regex("^\\s*\\*{0,2}\\s*Image\\s+\\d+\\s*\\*{0,2}\\s*:", kIcase), ImageMarker::Numbered},
        {regex("^\\s*\\*{0,2}\\s*Visual\\s+Content\\b", kIcase), ImageMarker::Banner},
        {regex("^\\s*\\*{0,2}\\s*Complete\\s+Page\\s+Visual\\s+Analysis\\b", kIcase), ImageMarker::Banner},
        {regex("^\\s*>\\s*\\*{0,2}\\s*(?:Figure|Fig\\.|Exhibit)\\s*\\d+", kIcase), ImageMarker::Quoted},
        {regex("^\\s*>\\s*\\*{0,2}\\s*(?:Visual\\s+Element|Table/Chart)\\b", kIcase), ImageMarker::Quoted},
    };
    return patterns;
}

const regex& number_regex() {
    static const regex pattern("\\b\\d+(?:[.,]\\d+)?%?");
    return pattern;
}

const regex& date_regex() {
    static const regex pattern(
        "\\b(?:19|20)\\d{2}\\b"
        "|\\b\\d{1,2}/\\d{1,2}/\\d{2,4}\\b"
        "|\\b(?:Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sep|Oct|Nov|Dec)[a-z]*\\.?\\s+\\d{1,4}\\b"
        "|\\bQ[1-4]\\s*(?:19|20)\\d{2}\\b");
    return pattern;
}

const regex& entity_regex() {
    static const regex pattern("\\b[A-Z][a-z]+(?:\\s+[A-Z][a-z]+)+\\b");
    return pattern;
}

const regex& exhibit_regex() {
    static const regex pattern("\\b(?:Exhibit|Figure|Fig\\.|Table|Chart)\\s*\\d+", kIcase);
    return pattern;
}

const regex& image_path_regex() {
    static const regex pattern("\\((figures/[^)\\s]+\\.png)\\)");
    return pattern;
}

const regex& source_regex() {
    static const regex pattern("^\\s*[*_]{0,2}\\s*Sources?\\s*[*_]{0,2}\\s*:\\s*[*_]{0,2}\\s*(.+)$", kIcase);
    return pattern;
}

bool is_terminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

} // namespace

std::optional<HeaderMatch> match_header(const std::string& line) {
    std::smatch match;
    if (!std::regex_match(line, match, header_regex())) {
        return std::nullopt;
    }
    HeaderMatch header;
    header.level = static_cast<int>(match[1].length());
    header.title = trim(match[2].str());
    if (header.title.empty()) {
        return std::nullopt;
    }
    return header;
}

bool is_major_header_line(const std::string& line) {
    auto header = match_header(line);
    return header && header->level <= 2;
}

bool is_header_line(const std::string& line) {
    return match_header(line).has_value();
}

bool is_page_artifact(const std::string& title) {
    return std::regex_match(title, page_artifact_regex());
}

bool is_list_item(const std::string& text) {
    return std::regex_search(text, list_item_regex(), std::regex_constants::match_continuous);
}

bool is_blank(std::string_view line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

bool opens_html_comment(std::string_view line) {
    return trim(line).rfind("<!--", 0) == 0;
}

bool closes_html_comment(std::string_view line) {
    return line.find("-->") != std::string_view::npos;
}

bool is_quote_line(std::string_view line) {
    return trim(line).rfind('>', 0) == 0;
}

bool is_horizontal_rule(const std::string& line) {
    return std::regex_match(line, horizontal_rule_regex());
}

bool is_table_row(const std::string& line) {
    return std::regex_match(line, table_row_regex());
}

bool is_table_separator(const std::string& line) {
    return line.find('|') != std::string::npos &&
           line.find('-') != std::string::npos &&
           std::regex_match(line, table_separator_regex());
}

bool is_table_caption(const std::string& line) {
    return std::regex_search(line, table_caption_regex(), std::regex_constants::match_continuous);
}

bool is_table_summary(const std::string& line) {
    return std::regex_search(line, table_summary_regex(), std::regex_constants::match_continuous);
}

ImageMarker classify_image_marker(const std::string& line) {
    for (const auto& marker : image_marker_patterns()) {
        if (std::regex_search(line, marker.pattern, std::regex_constants::match_continuous)) {
            return marker.kind;
        }
    }
    return ImageMarker::None;
}

bool is_image_marker(const std::string& line) {
    return classify_image_marker(line) != ImageMarker::None;
}

std::string trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string(text.substr(begin, end - begin));
}

std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    size_t start = 0;
    size_t i = 0;

    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isspace(c) && i > start && is_terminal(text[i - 1])) {
            sentences.push_back(text.substr(start, i - start));
            while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
            start = i;
            continue;
        }
        ++i;
    }

    if (start < text.size()) {
        sentences.push_back(text.substr(start));
    }
    return sentences;
}

int count_words(const std::string& text) {
    std::istringstream stream(text);
    std::string word;
    int count = 0;
    while (stream >> word) {
        ++count;
    }
    return count;
}

int count_sentences(const std::string& text) {
    int count = 0;
    for (const auto& sentence : split_sentences(text)) {
        if (!is_blank(sentence)) ++count;
    }
    return std::max(count, 1);
}

bool has_numerical_data(const std::string& text) {
    return std::regex_search(text, number_regex());
}

bool has_dates(const std::string& text) {
    return std::regex_search(text, date_regex());
}

bool has_named_entities(const std::string& text) {
    return std::regex_search(text, entity_regex());
}

bool has_exhibits(const std::string& text) {
    return std::regex_search(text, exhibit_regex());
}

std::optional<std::string> find_image_path(const std::string& text) {
    std::smatch match;
    if (std::regex_search(text, match, image_path_regex())) {
        return match[1].str();
    }
    return std::nullopt;
}

std::optional<std::string> find_source_attribution(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    std::smatch match;

    while (std::getline(stream, line)) {
        if (std::regex_match(line, match, source_regex())) {
            std::string source = trim(match[1].str());
            while (!source.empty() && (source.back() == '*' || source.back() == '_')) {
                source.pop_back();
            }
            source = trim(source);
            if (!source.empty()) {
                return source;
            }
        }
    }
    return std::nullopt;
}

} // namespace semantic_chunker
