#include "text/markdown_filter.h"
#include "utils.h"
#include <cctype>
#include <sstream>

namespace parley {

namespace {

std::string strip_line_prefix(const std::string& line) {
    size_t i = line.find_first_not_of(" \t");
    if (i == std::string::npos) return line;

    // "# Heading"
    size_t j = i;
    while (j < line.size() && line[j] == '#') ++j;
    if (j > i && j < line.size() && line[j] == ' ') {
        return line.substr(0, i) + line.substr(j + 1);
    }

    // "- item", "* item", "+ item"
    if ((line[i] == '-' || line[i] == '*' || line[i] == '+') &&
        i + 1 < line.size() && line[i + 1] == ' ') {
        return line.substr(0, i) + line.substr(i + 2);
    }

    // "> quote"
    if (line[i] == '>' ) {
        size_t k = i + 1;
        if (k < line.size() && line[k] == ' ') ++k;
        return line.substr(0, i) + line.substr(k);
    }
    return line;
}

std::string strip_inline(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        // [label](target) -> label
        if (c == '[') {
            size_t close = line.find(']', i + 1);
            if (close != std::string::npos && close + 1 < line.size() && line[close + 1] == '(') {
                size_t paren = line.find(')', close + 2);
                if (paren != std::string::npos) {
                    out += line.substr(i + 1, close - i - 1);
                    i = paren;
                    continue;
                }
            }
        }

        if (c == '*' || c == '`' || c == '~') {
            continue;
        }
        // Underscore emphasis only at word edges; keep snake_case intact
        if (c == '_') {
            bool prev_alnum = i > 0 && std::isalnum(static_cast<unsigned char>(line[i - 1]));
            bool next_alnum = i + 1 < line.size() && std::isalnum(static_cast<unsigned char>(line[i + 1]));
            if (!(prev_alnum && next_alnum)) continue;
        }
        out += c;
    }
    return out;
}

} // anonymous namespace

std::string strip_markdown(const std::string& text) {
    std::istringstream iss(text);
    std::string line;
    std::string out;
    bool first = true;
    bool trailing_newline = !text.empty() && text.back() == '\n';

    while (std::getline(iss, line)) {
        if (utils::starts_with(utils::trim_copy(line), "```")) {
            continue;
        }
        if (!first) out += '\n';
        out += strip_inline(strip_line_prefix(line));
        first = false;
    }
    if (trailing_newline) out += '\n';
    return out;
}

} // namespace parley
