#include "libdsge/source_text.hpp"

#include "libdsge/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <string_view>

namespace libdsge {

namespace {
constexpr std::array<std::string_view, 3> kValidExtensions{".rs", ".rz", ".dsge"};

std::string trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

// Strips // and % comments outside of quoted tex names.
std::string strip_comment(const std::string& line) {
    bool in_quote = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            in_quote = !in_quote;
            continue;
        }
        if (in_quote) {
            continue;
        }
        if (c == '%') {
            return line.substr(0, i);
        }
        if (c == '/' && i + 1 < line.size() && line[i + 1] == '/') {
            return line.substr(0, i);
        }
    }
    return line;
}
}  // namespace

std::string check_model_filename(const std::string& filename) {
    std::string name;
    name.reserve(filename.size());
    for (char c : filename) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            name.push_back(c);
        }
    }
    if (name.empty()) {
        throw ParseError("model file name must be non-empty", filename, 0);
    }
    const auto slash = name.find_last_of("/\\");
    const auto dot = name.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return name;
    }
    const std::string_view extension(name.data() + dot, name.size() - dot);
    if (std::find(kValidExtensions.begin(), kValidExtensions.end(), extension) == kValidExtensions.end()) {
        throw ParseError("model file is expected to have one of the extensions .rs, .rz or .dsge", name, 0);
    }
    return name.substr(0, dot);
}

std::vector<SourceLine> split_source_lines(const std::string& text, const std::string& file) {
    std::vector<SourceLine> lines;
    std::istringstream stream(text);
    std::string raw;
    std::size_t number = 0;
    while (std::getline(stream, raw)) {
        ++number;
        std::string cleaned = trim(strip_comment(raw));
        if (cleaned.empty()) {
            continue;
        }
        lines.push_back(SourceLine{std::move(cleaned), file, number});
    }
    return lines;
}

}  // namespace libdsge
