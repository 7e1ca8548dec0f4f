#pragma once

#include "libdsge/block_extractor.hpp"
#include "libdsge/expression.hpp"

#include <cstddef>
#include <string>

namespace libdsge {

// planner_objective{discount=...,commitment=...} loss;
struct PlannerObjective {
    ExprPtr loss;
    ExprPtr discount;
    ExprPtr commitment;
    std::string file;
    std::size_t line{0};
};

constexpr double kDefaultDiscount = 0.99;
constexpr double kDefaultCommitment = 1.0;

[[nodiscard]] PlannerObjective read_planner_objective(const Block& block);

}  // namespace libdsge
