#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace libdsge {

// One preprocessed, comment-free line of the model file.
struct SourceLine {
    std::string text;
    std::string file;
    std::size_t line{0};
};

// Returns the model name without extension. Accepts .rs, .rz and .dsge files.
[[nodiscard]] std::string check_model_filename(const std::string& filename);

// Splits raw model text into tagged lines, dropping comments and blank lines.
// No macro expansion is performed.
[[nodiscard]] std::vector<SourceLine> split_source_lines(const std::string& text, const std::string& file);

}  // namespace libdsge
