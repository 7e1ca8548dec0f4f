#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "libdsge/block_extractor.hpp"
#include "libdsge/dictionary_builder.hpp"
#include "libdsge/equation_compiler.hpp"
#include "libdsge/errors.hpp"
#include "libdsge/incidence.hpp"
#include "libdsge/source_text.hpp"

namespace {

libdsge::ModelEquations compile_equations(const std::string& text) {
    const auto blocks = libdsge::extract_blocks(libdsge::split_source_lines(text, "eqs.rs"));
    const auto symbols = libdsge::build_dictionary(blocks);
    const auto captured = libdsge::capture_equations(*blocks.find(libdsge::BlockKind::Model));
    return libdsge::compile_model_equations(captured, symbols, std::nullopt, false);
}

}  // namespace

TEST_CASE("capture_equations types each statement", "[equation_compiler]") {
    const auto blocks = libdsge::extract_blocks(libdsge::split_source_lines(
        "model\n"
        "  # r = 1/beta - 1;\n"
        "  mcp i >= 0;\n"
        "  y = a*x; y{+1};\n",
        "eqs.rs"));
    const auto captured = libdsge::capture_equations(*blocks.find(libdsge::BlockKind::Model));

    REQUIRE(captured.size() == 4);
    REQUIRE(captured[0].type == libdsge::EquationType::Definition);
    REQUIRE(captured[0].name == "r");
    REQUIRE(captured[0].original == "#r=1/beta-1");
    REQUIRE(captured[1].type == libdsge::EquationType::Complementarity);
    REQUIRE(captured[1].relation == libdsge::BinaryOp::GreaterEqual);
    REQUIRE(captured[1].original == "mcp i>=0");
    REQUIRE(captured[2].original == "y=a*x");
    REQUIRE(captured[2].line == 4);
    REQUIRE(captured[3].rhs == nullptr);
    REQUIRE(captured[3].original == "y{+1}");
}

TEST_CASE("capture_equations requires terminated statements", "[equation_compiler]") {
    const auto blocks = libdsge::extract_blocks(libdsge::split_source_lines("model\n  y = 1\n", "eqs.rs"));
    REQUIRE_THROWS_AS(libdsge::capture_equations(*blocks.find(libdsge::BlockKind::Model)), libdsge::ParseError);

    const auto bad_mcp = libdsge::extract_blocks(libdsge::split_source_lines("model\n  mcp i = 0;\n", "eqs.rs"));
    REQUIRE_THROWS_AS(libdsge::capture_equations(*bad_mcp.find(libdsge::BlockKind::Model)), libdsge::ParseError);
}

TEST_CASE("long lags are replaced by auxiliary variables", "[equation_compiler]") {
    const auto result = compile_equations(
        "endogenous y\n"
        "exogenous e\n"
        "parameters rho1 rho2\n"
        "model\n"
        "  y = rho1*y{-1} + rho2*y{-2} + e{-1};\n");

    REQUIRE(result.symbols.endogenous_names() == std::vector<std::string>{"AUX_L_e_1", "AUX_L_y_1", "y"});
    REQUIRE(result.symbols.original_names() == std::vector<std::string>{"y"});
    REQUIRE(result.symbols.endogenous()[0].is_auxiliary);
    REQUIRE(result.equations.size() == 3);
    REQUIRE(libdsge::to_string(*result.equations[0].residual) == "y-(rho1*y{-1}+rho2*AUX_L_y_1{-1}+AUX_L_e_1{-1})");
    REQUIRE(result.equations[1].original == "AUX_L_y_1=y{-1}");
    REQUIRE(result.equations[2].original == "AUX_L_e_1=e");
    REQUIRE(result.symbols.exogenous()[0].is_in_use);

    REQUIRE(result.auxiliaries.size() == 2);
    REQUIRE(result.auxiliaries[0].auxiliary == "AUX_L_y_1");
    REQUIRE_FALSE(result.auxiliaries[0].source_is_exogenous);
    REQUIRE(result.auxiliaries[1].source == "e");
    REQUIRE(result.auxiliaries[1].source_is_exogenous);

    Eigen::MatrixXi expected(3, 3);
    expected << 0, 1, 4, 0, 2, 5, 0, 3, 6;
    REQUIRE(result.after_reordering.lead_lag == expected);

    const auto& occurrences = result.equations[0].occurrences;
    REQUIRE(occurrences.size() == 4);
    REQUIRE(occurrences[0].endogenous == 0);
    REQUIRE(occurrences[0].shift == -1);
    REQUIRE(occurrences[2].endogenous == 2);
    REQUIRE(occurrences[2].shift == -1);
    REQUIRE(occurrences[3].shift == 0);
}

TEST_CASE("leads beyond one period use forward auxiliaries", "[equation_compiler]") {
    const auto result = compile_equations(
        "endogenous p\n"
        "parameters beta\n"
        "model\n"
        "  p = beta*p{+3};\n");

    REQUIRE(result.symbols.endogenous_names() == std::vector<std::string>{"AUX_F_p_1", "AUX_F_p_2", "p"});
    REQUIRE(libdsge::to_string(*result.equations[0].residual) == "p-beta*AUX_F_p_2{+1}");
    REQUIRE(result.equations[1].original == "AUX_F_p_1=p{+1}");
    REQUIRE(result.equations[2].original == "AUX_F_p_2=AUX_F_p_1{+1}");
}

TEST_CASE("the model must be square", "[equation_compiler]") {
    try {
        (void)compile_equations("endogenous y k\nmodel\n  y = 1;\n");
        FAIL("expected a model error");
    } catch (const libdsge::ModelError& error) {
        REQUIRE_THAT(std::string(error.what()), Catch::Matchers::ContainsSubstring("1 structural equations for 2 endogenous"));
    }
}

TEST_CASE("every variable must appear as current", "[equation_compiler]") {
    try {
        (void)compile_equations("endogenous y k\nparameters a\nmodel\n  y = a*k{-1};\n  y{+1} = y;\n");
        FAIL("expected a model error");
    } catch (const libdsge::ModelError& error) {
        REQUIRE_THAT(std::string(error.what()), Catch::Matchers::ContainsSubstring("do not appear as current: k"));
    }
}

TEST_CASE("unknown symbols are located in the model file", "[equation_compiler]") {
    try {
        (void)compile_equations("endogenous y\nmodel\n  y = z;\n");
        FAIL("expected a parse error");
    } catch (const libdsge::ParseError& error) {
        REQUIRE(error.detail() == "unknown symbol 'z' in equation (1)");
        REQUIRE(error.file() == "eqs.rs");
        REQUIRE(error.line() == 3);
    }
}

TEST_CASE("definitions are restricted to parameters and earlier definitions", "[equation_compiler]") {
    try {
        (void)compile_equations("endogenous y\nmodel\n  # d = y;\n  y = d;\n");
        FAIL("expected a model error");
    } catch (const libdsge::ModelError& error) {
        REQUIRE(error.equation() == 0);
        REQUIRE_THAT(std::string(error.what()), Catch::Matchers::ContainsSubstring("cannot contain variables"));
    }
    REQUIRE_THROWS_AS(compile_equations("endogenous y\nparameters a\nmodel\n  # d1 = d2;\n  # d2 = a;\n  y = d1;\n"),
                      libdsge::ModelError);

    const auto result = compile_equations("endogenous y\nparameters a\nmodel\n  # d1 = a;\n  # d2 = 2*d1;\n  y = d2;\n");
    REQUIRE(result.symbols.definitions() == std::vector<std::string>{"d1", "d2"});
    REQUIRE(result.equations[0].type == libdsge::EquationType::Definition);
    REQUIRE(libdsge::to_string(*result.equations[1].residual) == "2*d1");
}

TEST_CASE("exogenous variables cannot be led", "[equation_compiler]") {
    REQUIRE_THROWS_AS(compile_equations("endogenous y\nexogenous e\nmodel\n  y = e{+1};\n"), libdsge::ModelError);
}

TEST_CASE("transition probabilities defined in the model switch endogenously", "[equation_compiler]") {
    const auto result = compile_equations(
        "endogenous y\n"
        "parameters(a,2) rho\n"
        "model\n"
        "  a_tp_1_2 = 1/(1+exp(-y));\n"
        "  y = rho;\n");

    REQUIRE(result.equations[0].type == libdsge::EquationType::TimeVaryingProbability);
    REQUIRE(result.equations[0].name == "a_tp_1_2");
    REQUIRE(result.symbols.endogenous()[0].is_affect_trans_probs);
    REQUIRE(result.symbols.markov_chains()[1].is_endogenous);

    REQUIRE_THROWS_AS(compile_equations("endogenous y\n"
                                        "parameters(a,2) rho\n"
                                        "model\n"
                                        "  a_tp_1_2 = 1/(1+exp(-y{-1}));\n"
                                        "  y = rho;\n"),
                      libdsge::ModelError);

    try {
        (void)compile_equations("endogenous y\n"
                                "parameters(a,2) rho\n"
                                "model\n"
                                "  y = rho;\n"
                                "  a_tp_1_2 = 1/(1+exp(-y{+1}));\n");
        FAIL("a shifted variable in a transition probability should throw");
    } catch (const libdsge::ModelError& error) {
        REQUIRE(error.equation() == 1);
        REQUIRE_THAT(error.what(), Catch::Matchers::StartsWith("equation (2)"));
        REQUIRE_THAT(error.what(), Catch::Matchers::ContainsSubstring("cannot contain leads or lags"));
    }
}

TEST_CASE("parameters absent from the model are not in use", "[equation_compiler]") {
    const auto result = compile_equations("endogenous y\nparameters a b\nmodel\n  y = a;\n");
    REQUIRE(result.symbols.parameters()[0].is_in_use);
    REQUIRE_FALSE(result.symbols.parameters()[1].is_in_use);
}

TEST_CASE("alphabetical_order sorts names", "[incidence]") {
    REQUIRE(libdsge::alphabetical_order({"y", "c", "k"}) == std::vector<std::size_t>{1, 2, 0});
}

TEST_CASE("classify_variables reads the lead-lag incidence", "[incidence]") {
    Eigen::MatrixXi lli(4, 3);
    lli << 0, 3, 0, 1, 4, 7, 0, 5, 8, 2, 6, 0;
    const auto classes = libdsge::classify_variables(lli);

    REQUIRE(classes.is_static == std::vector<bool>{true, false, false, false});
    REQUIRE(classes.is_pred_frwrd_looking == std::vector<bool>{false, true, false, false});
    REQUIRE(classes.is_predetermined == std::vector<bool>{false, false, true, false});
    REQUIRE(classes.is_frwrd_looking == std::vector<bool>{false, false, false, true});
    REQUIRE(classes.is_state == std::vector<bool>{false, true, true, false});
}
