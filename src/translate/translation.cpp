#include "translation.hpp"

#include <sstream>

namespace translation {

std::string make_prompt(const std::string& word) {
    return "Translate, please, in to russian if word is in english or any other language. "
           "If its in russian, translate to english. Also, provide some context examples. "
           "Word: " + word;
}

std::string strip_markdown(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text.compare(i, 3, "---") == 0) {
            i += 2;
            continue;
        }
        if (text[i] == '*') continue;
        out += text[i];
    }
    return out;
}

std::string head(const std::string& text, size_t max_lines) {
    std::istringstream in(text);
    std::string line, out;
    for (size_t n = 0; n < max_lines && std::getline(in, line); ++n) {
        if (n > 0) out += "\n";
        out += line;
    }
    return out;
}

std::string summary(const std::string& text, size_t max_lines) {
    std::string joined;
    for (char c : head(text, max_lines)) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
        if (c == ' ' && !joined.empty() && joined.back() == ' ') continue;
        joined += c;
    }
    auto start = joined.find_first_not_of(' ');
    if (start == std::string::npos) return {};
    auto end = joined.find_last_not_of(' ');
    return joined.substr(start, end - start + 1);
}

} // namespace translation
