#include <catch2/catch_test_macros.hpp>

#include <string>

#include "libdsge/errors.hpp"
#include "libdsge/source_text.hpp"

TEST_CASE("check_model_filename accepts model extensions", "[source_text]") {
    REQUIRE(libdsge::check_model_filename("rbc.rs") == "rbc");
    REQUIRE(libdsge::check_model_filename("models/nk.dsge") == "models/nk");
    REQUIRE(libdsge::check_model_filename("svar.rz") == "svar");
    REQUIRE(libdsge::check_model_filename("plain") == "plain");
}

TEST_CASE("check_model_filename rejects other extensions", "[source_text]") {
    REQUIRE_THROWS_AS(libdsge::check_model_filename("rbc.txt"), libdsge::ParseError);
    REQUIRE_THROWS_AS(libdsge::check_model_filename("  "), libdsge::ParseError);
}

TEST_CASE("split_source_lines drops comments and keeps line numbers", "[source_text]") {
    const std::string text =
        "endogenous y % output\n"
        "\n"
        "// a full comment line\n"
        "model\n"
        "   y = 1; // trailing\n"
        "parameters beta \"\\beta % not a comment\"\n";
    const auto lines = libdsge::split_source_lines(text, "m.rs");

    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0].text == "endogenous y");
    REQUIRE(lines[0].line == 1);
    REQUIRE(lines[1].text == "model");
    REQUIRE(lines[1].line == 4);
    REQUIRE(lines[2].text == "y = 1;");
    REQUIRE(lines[2].line == 5);
    REQUIRE(lines[2].file == "m.rs");
    REQUIRE(lines[3].text == "parameters beta \"\\beta % not a comment\"");
}

TEST_CASE("ParseError prefixes file and line", "[source_text][errors]") {
    const libdsge::ParseError located("bad token", "m.rs", 12);
    REQUIRE(std::string(located.what()) == "m.rs:12: bad token");
    REQUIRE(located.file() == "m.rs");
    REQUIRE(located.line() == 12);
    REQUIRE(located.detail() == "bad token");

    const libdsge::ParseError anonymous("bad token", "", 3);
    REQUIRE(std::string(anonymous.what()) == "line 3: bad token");

    const libdsge::ModelError model_error("is wrong", 1);
    REQUIRE(std::string(model_error.what()) == "equation (2) is wrong");
    REQUIRE(model_error.equation() == 1);
}
