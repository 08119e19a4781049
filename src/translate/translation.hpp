#pragma once

#include <string>

namespace translation {

// Single-message prompt asking for an English <-> Russian translation with examples.
std::string make_prompt(const std::string& word);

// Removes "**", "*" and "---" markdown markers.
std::string strip_markdown(const std::string& text);

// First max_lines lines joined by single spaces, runs of spaces collapsed.
std::string summary(const std::string& text, size_t max_lines = 3);

// First max_lines lines, newlines kept.
std::string head(const std::string& text, size_t max_lines);

} // namespace translation
