#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <string>

#include "libdsge/block_extractor.hpp"
#include "libdsge/dictionary_builder.hpp"
#include "libdsge/errors.hpp"
#include "libdsge/parameterization.hpp"
#include "libdsge/planner.hpp"
#include "libdsge/source_text.hpp"

namespace {

const std::string kParameters =
    "parameters(a,2) rho\n"
    "parameters beta sig\n";

std::vector<libdsge::ParameterValue> read(const std::string& statements) {
    const auto blocks = libdsge::extract_blocks(libdsge::split_source_lines(kParameters + "parameterization\n" + statements, "p.rs"));
    const auto symbols = libdsge::build_dictionary(blocks);
    return libdsge::read_parameterization(*blocks.find(libdsge::BlockKind::Parameterization), symbols);
}

}  // namespace

TEST_CASE("read_parameterization reads values, bounds and priors", "[parameterization]") {
    const auto values = read(
        "  beta, 0.99;\n"
        "  rho(a,1), 0.5, 0, 1;\n"
        "  rho(a,2), 0.9, 0, 1, beta_pdf(0.5,0.2);\n"
        "  sig, 1/2;\n");

    REQUIRE(values.size() == 4);
    REQUIRE(values[0].parameter == 1);
    REQUIRE(values[0].value == Catch::Approx(0.99));
    REQUIRE_FALSE(values[0].lower.has_value());

    REQUIRE(values[1].parameter == 0);
    REQUIRE(values[1].chain == 1);
    REQUIRE(values[1].state == 1);
    REQUIRE(*values[1].upper == Catch::Approx(1.0));

    REQUIRE(values[2].state == 2);
    REQUIRE(values[2].prior == "beta_pdf(0.5,0.2)");
    REQUIRE(values[3].value == Catch::Approx(0.5));
    REQUIRE(values[3].line == 7);
}

TEST_CASE("read_parameterization rejects malformed statements", "[parameterization]") {
    REQUIRE_THROWS_AS(read("  rho, 0.5;\n"), libdsge::ParseError);
    REQUIRE_THROWS_AS(read("  rho(a,3), 0.5;\n"), libdsge::ParseError);
    REQUIRE_THROWS_AS(read("  beta(a,1), 0.5;\n"), libdsge::ParseError);
    REQUIRE_THROWS_AS(read("  gamma, 1;\n"), libdsge::ParseError);
    REQUIRE_THROWS_AS(read("  beta, sig;\n"), libdsge::ParseError);
    REQUIRE_THROWS_AS(read("  beta, 0.5, 1;\n"), libdsge::ParseError);
    REQUIRE_THROWS_AS(read("  beta, 0.5, 1, 0;\n"), libdsge::ParseError);
    REQUIRE_THROWS_AS(read("  beta, 0.5\n"), libdsge::ParseError);
}

TEST_CASE("read_planner_objective reads options and the loss", "[planner]") {
    const auto blocks = libdsge::extract_blocks(libdsge::split_source_lines(
        "planner_objective{discount = 0.95, commitment = 0}\n"
        "  pi^2 + lambda*x^2;\n",
        "planner.rs"));
    const auto planner = libdsge::read_planner_objective(*blocks.find(libdsge::BlockKind::PlannerObjective));

    REQUIRE(libdsge::to_string(*planner.loss) == "pi^2+lambda*x^2");
    REQUIRE(libdsge::to_string(*planner.discount) == "0.95");
    REQUIRE(libdsge::to_string(*planner.commitment) == "0");
    REQUIRE(planner.line == 2);

    const auto defaults = libdsge::extract_blocks(libdsge::split_source_lines("planner_objective\n  pi^2;\n", "planner.rs"));
    const auto plain = libdsge::read_planner_objective(*defaults.find(libdsge::BlockKind::PlannerObjective));
    REQUIRE(libdsge::to_string(*plain.discount) == "0.99");
    REQUIRE(libdsge::to_string(*plain.commitment) == "1");

    const auto twice = libdsge::extract_blocks(libdsge::split_source_lines("planner_objective\n  pi^2;\n  x^2;\n", "planner.rs"));
    REQUIRE_THROWS_AS(libdsge::read_planner_objective(*twice.find(libdsge::BlockKind::PlannerObjective)), libdsge::ParseError);
}
