#pragma once

#include "libdsge/compiled_model.hpp"
#include "libdsge/compiler_options.hpp"
#include "libdsge/source_text.hpp"

#include <string>
#include <vector>

namespace libdsge {

// Entry point: model text to symbol tables, incidence and printed routines.
// Errors are ParseError, ModelError or ConfigurationError; nothing is
// returned on failure.
class ModelCompiler {
public:
    explicit ModelCompiler(CompilerOptions options = {});

    [[nodiscard]] const CompilerOptions& options() const noexcept { return options_; }

    // Lines are macro-expanded and comment-free.
    [[nodiscard]] CompiledModel compile(const std::vector<SourceLine>& lines, const std::string& name = {}) const;

    // Raw model text; filename must carry a model extension.
    [[nodiscard]] CompiledModel compile(const std::string& text, const std::string& filename) const;

private:
    CompilerOptions options_;
};

}  // namespace libdsge
