#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <vector>

#include "libdsge/block_extractor.hpp"
#include "libdsge/dictionary_builder.hpp"
#include "libdsge/equation_compiler.hpp"
#include "libdsge/errors.hpp"
#include "libdsge/shadow.hpp"
#include "libdsge/source_text.hpp"
#include "libdsge/steady_state.hpp"

namespace {

const std::string kDeclarations =
    "endogenous c k\n"
    "exogenous e\n"
    "parameters alpha delta\n"
    "log_vars c\n"
    "model\n"
    "  c = k^alpha - delta*k{-1} + e;\n"
    "  k = delta*k{-1} + alpha;\n";

struct Compiled {
    libdsge::BlockSet blocks;
    libdsge::ModelEquations equations;
};

Compiled compile(const std::string& extra) {
    Compiled result;
    result.blocks = libdsge::extract_blocks(libdsge::split_source_lines(kDeclarations + extra, "ss.rs"));
    const auto symbols = libdsge::build_dictionary(result.blocks);
    result.equations = libdsge::compile_model_equations(
        libdsge::capture_equations(*result.blocks.find(libdsge::BlockKind::Model)), symbols, std::nullopt, false);
    return result;
}

}  // namespace

TEST_CASE("steady_state_model assignments become static code", "[steady_state]") {
    const auto compiled = compile(
        "steady_state_model(unique)\n"
        "  k = 10;\n"
        "  c = k^alpha - delta*k + 1;\n"
        "  alpha = 0.3;\n");
    const auto& symbols = compiled.equations.symbols;
    REQUIRE(symbols.endogenous_names() == std::vector<std::string>{"LOG_c", "k"});

    const libdsge::ShadowWriter shadow(symbols, compiled.equations.after_reordering.lead_lag, {});
    const auto model =
        libdsge::compile_steady_state_model(compiled.blocks.find(libdsge::BlockKind::SteadyStateModel), symbols, shadow, false);

    REQUIRE(model.routine.name == "steady_state_model");
    REQUIRE(model.routine.code == std::vector<std::string>{"y_2=10", "y_1=log(y_2^param_1-param_2*y_2+1)", "param_1=0.3"});
    REQUIRE(model.is_unique);
    REQUIRE_FALSE(model.is_imposed);
    REQUIRE(model.is_param_changed == std::vector<bool>{true, false});
}

TEST_CASE("a missing steady_state_model block gives an empty routine", "[steady_state]") {
    const auto compiled = compile("");
    const libdsge::ShadowWriter shadow(compiled.equations.symbols, compiled.equations.after_reordering.lead_lag, {});
    const auto model = libdsge::compile_steady_state_model(nullptr, compiled.equations.symbols, shadow, false);
    REQUIRE(model.routine.code.empty());
    REQUIRE(model.is_param_changed == std::vector<bool>{false, false});
}

TEST_CASE("steady_state_model rejects shifts and non-assignments", "[steady_state]") {
    auto run = [](const std::string& block) {
        const auto compiled = compile(block);
        const libdsge::ShadowWriter shadow(compiled.equations.symbols, compiled.equations.after_reordering.lead_lag, {});
        return libdsge::compile_steady_state_model(
            compiled.blocks.find(libdsge::BlockKind::SteadyStateModel), compiled.equations.symbols, shadow, false);
    };
    REQUIRE_THROWS_AS(run("steady_state_model\n  k = k{+1};\n"), libdsge::ModelError);
    REQUIRE_THROWS_AS(run("steady_state_model\n  k{-1} = 1;\n"), libdsge::ParseError);
    REQUIRE_THROWS_AS(run("steady_state_model\n  e = 1;\n"), libdsge::ParseError);
    REQUIRE_THROWS_AS(run("steady_state_model\n  k = z;\n"), libdsge::ParseError);
}

TEST_CASE("auxiliary variables share the steady state of their source", "[steady_state]") {
    const auto blocks = libdsge::extract_blocks(libdsge::split_source_lines(
        "endogenous y\n"
        "exogenous e\n"
        "parameters rho1 rho2\n"
        "model\n"
        "  y = rho1*y{-1} + rho2*y{-2} + e{-1};\n",
        "aux.rs"));
    const auto equations = libdsge::compile_model_equations(libdsge::capture_equations(*blocks.find(libdsge::BlockKind::Model)),
                                                            libdsge::build_dictionary(blocks),
                                                            std::nullopt,
                                                            false);
    const auto routine = libdsge::steady_state_auxiliary_routine(equations.auxiliaries, equations.symbols);
    REQUIRE(routine.code == std::vector<std::string>{"y_2=y_3", "y_1=x_1"});
}

TEST_CASE("exogenous definitions are written over parameters", "[steady_state]") {
    const auto compiled = compile(
        "exogenous_definitions\n"
        "  e = 0.1*alpha;\n");
    const libdsge::ShadowWriter shadow(compiled.equations.symbols, compiled.equations.after_reordering.lead_lag, {});
    const auto routine = libdsge::exogenous_definitions_routine(
        compiled.blocks.find(libdsge::BlockKind::ExogenousDefinitions), compiled.equations.symbols, shadow, false);
    REQUIRE(routine.name == "exogenous_definitions");
    REQUIRE(routine.code == std::vector<std::string>{"x_1=0.1*param_1"});

    const auto invalid = compile("exogenous_definitions\n  e = k;\n");
    const libdsge::ShadowWriter invalid_shadow(invalid.equations.symbols, invalid.equations.after_reordering.lead_lag, {});
    REQUIRE_THROWS_AS(libdsge::exogenous_definitions_routine(invalid.blocks.find(libdsge::BlockKind::ExogenousDefinitions),
                                                             invalid.equations.symbols,
                                                             invalid_shadow,
                                                             false),
                      libdsge::ModelError);
}
