#include <vista/commit_message.hpp>

#include <cctype>
#include <vector>

namespace vista {

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = s.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(s.substr(start));
            return lines;
        }
        lines.push_back(s.substr(start, nl - start));
        start = nl + 1;
    }
}

static std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

static bool is_blank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static std::string rtrim(std::string s) {
    while (!s.empty() && is_blank(s.back())) s.pop_back();
    return s;
}

static std::string ltrim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && is_blank(s[i])) ++i;
    return s.substr(i);
}

std::string strip_comment_lines(const std::string& message) {
    std::vector<std::string> kept;
    for (const auto& line : split_lines(message)) {
        size_t first = line.find_first_not_of(" \t");
        if (first != std::string::npos && line[first] == '#') continue;
        kept.push_back(line);
    }
    return join_lines(kept);
}

static void wrap_line(const std::string& line, size_t column,
                      std::vector<std::string>& out) {
    std::string rest = line;
    while (rest.size() > column) {
        size_t cut = rest.find_last_of(" \t", column);
        if (cut == std::string::npos || cut == 0) {
            // One long word: emit it whole
            cut = rest.find_first_of(" \t", column);
            if (cut == std::string::npos) break;
        }
        out.push_back(rtrim(rest.substr(0, cut)));
        rest = ltrim(rest.substr(cut + 1));
    }
    out.push_back(rtrim(rest));
}

std::string wrap_commit_message(const std::string& message, int column) {
    auto lines = split_lines(message);
    size_t width = column > 0 ? static_cast<size_t>(column) : 72;

    std::vector<std::string> out;
    out.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i == 0 || lines[i].size() <= width) {
            out.push_back(lines[i]);
        } else {
            wrap_line(lines[i], width, out);
        }
    }
    return join_lines(out);
}

std::string format_commit_message(const std::string& message, int column) {
    return wrap_commit_message(rtrim(strip_comment_lines(message)), column);
}

} // namespace vista
