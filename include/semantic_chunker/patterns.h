#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace semantic_chunker {

// Line-level classifiers for the markdown dialect written by the extractor.
// Compiled patterns are owned by patterns.cpp and built once on first use.

struct HeaderMatch {
    int level = 0;
    std::string title;
};

std::optional<HeaderMatch> match_header(const std::string& line);
bool is_major_header_line(const std::string& line);  // # or ##
bool is_header_line(const std::string& line);
bool is_page_artifact(const std::string& title);     // "Page 12"
bool is_list_item(const std::string& text);
bool is_blank(std::string_view line);
bool opens_html_comment(std::string_view line);   // stripped line starts with <!--
bool closes_html_comment(std::string_view line);
bool is_quote_line(std::string_view line);
bool is_horizontal_rule(const std::string& line);

bool is_table_row(const std::string& line);
bool is_table_separator(const std::string& line);
bool is_table_caption(const std::string& line);
bool is_table_summary(const std::string& line);

// Banners run to the next #..### header or rule. Numbered entries also end at
// the next numbered entry; quoted entries end at a blank line that is not
// followed by another quoted line.
enum class ImageMarker { None, Banner, Numbered, Quoted };

ImageMarker classify_image_marker(const std::string& line);
bool is_image_marker(const std::string& line);

std::string trim(std::string_view text);
std::string to_lower(std::string_view text);

// Splits on whitespace that follows '.', '!' or '?'. Pieces keep their
// terminal punctuation; the whitespace itself is dropped.
std::vector<std::string> split_sentences(const std::string& text);

int count_words(const std::string& text);
int count_sentences(const std::string& text);

bool has_numerical_data(const std::string& text);
bool has_dates(const std::string& text);
bool has_named_entities(const std::string& text);
bool has_exhibits(const std::string& text);

std::optional<std::string> find_image_path(const std::string& text);
std::optional<std::string> find_source_attribution(const std::string& text);

} // namespace semantic_chunker
