#pragma once

#include "libdsge/source_text.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace libdsge {

enum class BlockKind {
    Endogenous,
    Exogenous,
    Parameters,
    Observables,
    LogVars,
    Model,
    SteadyStateModel,
    Parameterization,
    ParameterRestrictions,
    ExogenousDefinitions,
    PlannerObjective
};

struct Block {
    BlockKind kind;
    std::string name;
    std::vector<std::string> trigger;  // items of "keyword(a,b)" or "keyword{a=1,b=2}"
    std::vector<SourceLine> listing;
    std::string file;
    std::size_t line{0};
};

struct DeclaredChain {
    std::string name;
    std::size_t number_of_states{0};
    std::string file;
    std::size_t line{0};
};

struct BlockSet {
    std::vector<Block> blocks;
    std::vector<DeclaredChain> markov_chains;

    // First block of the given kind, or nullptr.
    [[nodiscard]] const Block* find(BlockKind kind) const noexcept;

    [[nodiscard]] std::vector<const Block*> all(BlockKind kind) const;
};

[[nodiscard]] std::optional<BlockKind> find_block_keyword(const std::string& word);

[[nodiscard]] std::string block_name(BlockKind kind);

// Declaration blocks may appear several times; every other block at most once.
[[nodiscard]] bool is_declaration_block(BlockKind kind) noexcept;

// Partitions macro-expanded lines into blocks. Text before the first block
// keyword, a repeated non-declaration block, or a malformed trigger is a
// ParseError naming the block and its file/line.
[[nodiscard]] BlockSet extract_blocks(const std::vector<SourceLine>& lines);

}  // namespace libdsge
