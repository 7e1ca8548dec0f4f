#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cmath>
#include <initializer_list>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "libdsge/errors.hpp"
#include "libdsge/model_compiler.hpp"
#include "libdsge/routine_evaluator.hpp"

using Positions = std::vector<std::size_t>;

namespace {

const std::string kRbc =
    "endogenous y c k\n"
    "exogenous e\n"
    "parameters alpha beta delta\n"
    "model\n"
    "  c + k = y + (1-delta)*k{-1};\n"
    "  y = exp(e)*k{-1}^alpha;\n"
    "  1/c = beta/c{+1}*(alpha*y{+1}/k + 1 - delta);\n"
    "parameterization\n"
    "  alpha, 0.33;\n"
    "  beta, 0.99;\n"
    "  delta, 0.025;\n";

libdsge::CompiledModel compile(const std::string& text, libdsge::CompilerOptions options = {}) {
    return libdsge::ModelCompiler(std::move(options)).compile(text, "model.rs");
}

Eigen::VectorXd vector_of(std::initializer_list<double> values) {
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double value : values) {
        v(i++) = value;
    }
    return v;
}

// Dynamic RBC point: y = [c+, y+, c, k, y, k-].
struct RbcPoint {
    Eigen::VectorXd y = vector_of({1.25, 2.1, 1.2, 10.0, 2.0, 9.5});
    Eigen::VectorXd x = vector_of({0.01});
    Eigen::VectorXd param = vector_of({0.33, 0.99, 0.025});

    void perturb(const libdsge::SymbolId& symbol, double step) {
        auto& target = symbol.kind() == libdsge::SymbolKind::Endogenous ? y : x;
        target(static_cast<Eigen::Index>(symbol.number() - 1)) += step;
    }

    libdsge::RoutineEvaluator evaluator() const {
        libdsge::RoutineEvaluator evaluator;
        evaluator.bind(libdsge::SymbolKind::Endogenous, y);
        evaluator.bind(libdsge::SymbolKind::Exogenous, x);
        evaluator.bind(libdsge::SymbolKind::Parameter, param);
        return evaluator;
    }
};

}  // namespace

TEST_CASE("ModelCompiler compiles a growth model", "[model_compiler]") {
    const auto model = compile(kRbc);

    REQUIRE(model.name == "model");
    REQUIRE(model.symbols.endogenous_names() == std::vector<std::string>{"c", "k", "y"});
    REQUIRE(model.equations_of(libdsge::EquationType::Structural).size() == 3);

    Eigen::MatrixXi expected(3, 3);
    expected << 1, 3, 0, 0, 4, 6, 2, 5, 0;
    REQUIRE(model.after_reordering.lead_lag == expected);

    const auto& list = model.differentiation_list;
    REQUIRE(libdsge::render_all(list.wrt) == std::vector<std::string>{"y_1", "y_2", "y_4", "y_3", "y_5", "y_6", "x_1"});
    REQUIRE(list.order_var == Positions{2, 1, 3});
    REQUIRE(list.sizes.np == 1);
    REQUIRE(list.sizes.nf == 2);
    REQUIRE(list.sizes.ne == 1);
    REQUIRE(list.sizes.nv == 7);
    REQUIRE(list.locations.f_plus == Positions{1, 2});
    REQUIRE(list.locations.p_0 == Positions{3});
    REQUIRE(list.locations.f_0 == Positions{4, 5});
    REQUIRE(list.locations.p_minus == Positions{6});
    REQUIRE(list.locations.e_0 == Positions{7});

    REQUIRE(model.equations[1].shadow == "y_5-exp(x_1)*y_6^param_1");
    REQUIRE(model.routines.functions.static_model.code[1] == "y_3-exp(x_1)*y_2^param_1");
    REQUIRE(model.classification.is_predetermined == std::vector<bool>{false, true, false});
    REQUIRE(model.is_lagrange_multiplier == std::vector<bool>{false, false, false});

    REQUIRE_FALSE(model.flags.is_linear);
    REQUIRE(model.flags.is_hybrid);
    REQUIRE_FALSE(model.flags.is_purely_forward_looking);
    REQUIRE_FALSE(model.flags.is_purely_backward_looking);
    REQUIRE_FALSE(model.flags.is_optimal_policy);
    REQUIRE(model.regimes.size() == 1);

    REQUIRE(model.parameterization.size() == 3);
    REQUIRE(model.parameterization[2].parameter == 2);
    REQUIRE(model.parameterization[2].value == 0.025);
}

TEST_CASE("dynamic derivatives match finite differences", "[model_compiler]") {
    const auto model = compile(kRbc);
    const auto& routine = model.routines.derivatives.dynamic;
    REQUIRE(routine.derivatives.size() == 2);
    const double h = 1e-6;
    const auto nv = static_cast<Eigen::Index>(routine.wrt.size());

    RbcPoint point;
    const Eigen::MatrixXd jacobian(point.evaluator().evaluate_derivatives(routine, 1));
    REQUIRE(jacobian.cols() == nv);
    for (Eigen::Index j = 0; j < nv; ++j) {
        RbcPoint up;
        RbcPoint down;
        up.perturb(routine.wrt[static_cast<std::size_t>(j)], h);
        down.perturb(routine.wrt[static_cast<std::size_t>(j)], -h);
        const Eigen::VectorXd slope =
            (up.evaluator().evaluate_functions(routine) - down.evaluator().evaluate_functions(routine)) / (2 * h);
        for (Eigen::Index e = 0; e < 3; ++e) {
            REQUIRE_THAT(jacobian(e, j), Catch::Matchers::WithinAbs(slope(e), 1e-6));
        }
    }

    const Eigen::MatrixXd hessian(point.evaluator().evaluate_derivatives(routine, 2));
    REQUIRE(hessian.cols() == nv * nv);
    REQUIRE_FALSE(routine.derivatives[1].entries.empty());
    for (const auto& entry : routine.derivatives[1].entries) {
        const auto i = static_cast<Eigen::Index>(entry.wrt[0]);
        const auto j = static_cast<Eigen::Index>(entry.wrt[1]);
        RbcPoint up;
        RbcPoint down;
        up.perturb(routine.wrt[entry.wrt[1]], h);
        down.perturb(routine.wrt[entry.wrt[1]], -h);
        const auto row = static_cast<Eigen::Index>(entry.equation);
        const double expected = (Eigen::MatrixXd(up.evaluator().evaluate_derivatives(routine, 1))(row, i) -
                                 Eigen::MatrixXd(down.evaluator().evaluate_derivatives(routine, 1))(row, i)) /
                                (2 * h);
        REQUIRE_THAT(hessian(row, i + j * nv), Catch::Matchers::WithinAbs(expected, 1e-5));
    }
}

TEST_CASE("static and growth path variants follow the options", "[model_compiler]") {
    const auto model = compile(kRbc);
    REQUIRE(model.routines.derivatives.static_model.wrt.size() == 3);
    REQUIRE(model.routines.derivatives.balanced_growth_path.has_value());
    REQUIRE(model.routines.derivatives.balanced_growth_path->wrt.size() == 6);
    REQUIRE_FALSE(model.routines.derivatives.parameters.has_value());
    REQUIRE_FALSE(model.routines.derivatives.planner.has_value());

    libdsge::CompilerOptions options;
    options.stationary_model = true;
    REQUIRE_FALSE(compile(kRbc, options).routines.derivatives.balanced_growth_path.has_value());

    options.max_deriv_order = 1;
    const auto first = compile(kRbc, options);
    REQUIRE(first.routines.derivatives.dynamic.derivatives.size() == 1);

    const auto& order_one = first.routines.derivatives.dynamic.derivatives[0].entries;
    const auto& order_two = model.routines.derivatives.dynamic.derivatives[0].entries;
    REQUIRE(order_one.size() == order_two.size());
    for (std::size_t k = 0; k < order_one.size(); ++k) {
        REQUIRE(order_one[k].equation == order_two[k].equation);
        REQUIRE(order_one[k].wrt == order_two[k].wrt);
        REQUIRE(order_one[k].code == order_two[k].code);
    }
}

TEST_CASE("linear models are differentiated once", "[model_compiler]") {
    const auto model = compile(
        "endogenous y\n"
        "exogenous e\n"
        "parameters rho\n"
        "model(linear)\n"
        "  y = rho*y{-1} + e;\n");
    REQUIRE(model.flags.is_linear);
    REQUIRE(model.flags.is_purely_backward_looking);
    REQUIRE_FALSE(model.flags.is_hybrid);
    REQUIRE(model.routines.derivatives.dynamic.derivatives.size() == 1);
}

TEST_CASE("timing flags follow leads and lags", "[model_compiler]") {
    const auto static_model = compile(
        "endogenous y\n"
        "exogenous e\n"
        "parameters a\n"
        "model\n"
        "  y = a*e;\n");
    REQUIRE_FALSE(static_model.flags.is_hybrid);
    REQUIRE_FALSE(static_model.flags.is_purely_forward_looking);
    REQUIRE_FALSE(static_model.flags.is_purely_backward_looking);

    const auto forward = compile(
        "endogenous y\n"
        "exogenous e\n"
        "parameters a\n"
        "model\n"
        "  y = a*y{+1} + e;\n");
    REQUIRE_FALSE(forward.flags.is_hybrid);
    REQUIRE(forward.flags.is_purely_forward_looking);
    REQUIRE_FALSE(forward.flags.is_purely_backward_looking);

    const auto backward = compile(
        "endogenous y\n"
        "exogenous e\n"
        "parameters a\n"
        "model\n"
        "  y = a*y{-1} + e;\n");
    REQUIRE_FALSE(backward.flags.is_hybrid);
    REQUIRE_FALSE(backward.flags.is_purely_forward_looking);
    REQUIRE(backward.flags.is_purely_backward_looking);
}

TEST_CASE("compilation is deterministic and ignores declaration order", "[model_compiler]") {
    const auto first = compile(kRbc);
    const auto second = compile(kRbc);
    REQUIRE(first.routines.functions.dynamic.code == second.routines.functions.dynamic.code);
    const auto& a = first.routines.derivatives.dynamic.derivatives[1].entries;
    const auto& b = second.routines.derivatives.dynamic.derivatives[1].entries;
    REQUIRE(a.size() == b.size());
    for (std::size_t k = 0; k < a.size(); ++k) {
        REQUIRE(a[k].code == b[k].code);
    }

    std::string reordered = kRbc;
    reordered.replace(reordered.find("endogenous y c k"), 16, "endogenous k y c");
    const auto third = compile(reordered);
    REQUIRE(third.symbols.endogenous_names() == first.symbols.endogenous_names());
    REQUIRE(third.after_reordering.lead_lag == first.after_reordering.lead_lag);
    REQUIRE(third.routines.functions.dynamic.code == first.routines.functions.dynamic.code);
    REQUIRE(libdsge::render_all(third.routines.derivatives.dynamic.wrt) ==
            libdsge::render_all(first.routines.derivatives.dynamic.wrt));

    const RbcPoint point;
    const Eigen::MatrixXd jacobian(point.evaluator().evaluate_derivatives(first.routines.derivatives.dynamic, 1));
    const Eigen::MatrixXd reordered_jacobian(
        point.evaluator().evaluate_derivatives(third.routines.derivatives.dynamic, 1));
    REQUIRE(reordered_jacobian.rows() == jacobian.rows());
    REQUIRE(reordered_jacobian.cols() == jacobian.cols());
    REQUIRE((reordered_jacobian - jacobian).cwiseAbs().maxCoeff() == 0.0);
}

TEST_CASE("definitions are kept apart unless inserted", "[model_compiler]") {
    const std::string text =
        "endogenous y\n"
        "exogenous e\n"
        "parameters rho sig\n"
        "model\n"
        "  # s2 = sig^2;\n"
        "  y = rho*y{-1} + s2*e;\n";

    std::ostringstream log;
    libdsge::CompilerOptions options;
    options.parameter_differentiation = true;
    options.log = &log;
    const auto model = compile(text, options);

    REQUIRE(model.routines.definitions.code == std::vector<std::string>{"def_1=param_2^2"});
    REQUIRE(model.equations[0].type == libdsge::EquationType::Definition);
    REQUIRE(model.equations[1].shadow == "y_1-(param_1*y_2+def_1*x_1)");
    REQUIRE(model.routines.derivatives.parameters->derivatives[0].entries.size() == 1);
    REQUIRE(model.routines.derivatives.parameters->derivatives[0].entries[0].code == "-y_2");
    REQUIRE_THAT(log.str(), Catch::Matchers::ContainsSubstring("[libdsge] definitions are not used"));
    REQUIRE_THAT(log.str(), Catch::Matchers::ContainsSubstring("[libdsge] dynamic_derivatives"));

    options.log = nullptr;
    options.definitions_in_param_differentiation = true;
    REQUIRE(compile(text, options).routines.derivatives.parameters->derivatives[0].entries.size() == 2);

    options.definitions_inserted = true;
    const auto inserted = compile(text, options);
    REQUIRE(inserted.equations[1].shadow == "y_1-(param_1*y_2+param_2^2*x_1)");
    REQUIRE(inserted.routines.functions.dynamic.code[0] == "y_1-(param_1*y_2+param_2^2*x_1)");
}

TEST_CASE("planner objective yields loss routines and a Hessian", "[model_compiler]") {
    const std::string text =
        "endogenous pi x\n"
        "exogenous u\n"
        "parameters beta kappa lambda\n"
        "model\n"
        "  pi = beta*pi{+1} + kappa*x + u;\n"
        "  x = x{+1} - pi{+1};\n"
        "planner_objective{discount = 0.99, commitment = 1}\n"
        "  pi^2 + lambda*x^2;\n";
    const auto model = compile(text);

    REQUIRE(model.flags.is_optimal_policy);
    REQUIRE(model.routines.planner_objective->code == std::vector<std::string>{"y_3^2+param_3*y_4^2"});
    REQUIRE(model.routines.planner_loss_commitment_discount->code ==
            std::vector<std::string>{"y_3^2+param_3*y_4^2", "1", "0.99"});

    const auto& planner = *model.routines.derivatives.planner;
    REQUIRE(libdsge::render_all(planner.wrt) == std::vector<std::string>{"y_3", "y_4"});
    libdsge::RoutineEvaluator evaluator;
    evaluator.bind(libdsge::SymbolKind::Endogenous, vector_of({0.0, 0.0, 0.1, 0.2}));
    evaluator.bind(libdsge::SymbolKind::Parameter, vector_of({0.99, 0.1, 0.5}));
    const Eigen::MatrixXd hessian(evaluator.evaluate_derivatives(planner, 2));
    REQUIRE(hessian(0, 0) == 2.0);
    REQUIRE(hessian(0, 3) == 1.0);

    libdsge::CompilerOptions options;
    options.add_welfare = true;
    const auto welfare = compile(text, options);
    REQUIRE(welfare.symbols.find_endogenous("UTIL") != libdsge::SymbolTable::npos);
    REQUIRE(welfare.symbols.find_endogenous("WELF") != libdsge::SymbolTable::npos);
    REQUIRE(welfare.equations_of(libdsge::EquationType::Structural).size() == 4);

    try {
        (void)compile(kRbc, options);
        FAIL("add_welfare without a planner objective should throw");
    } catch (const libdsge::ModelError& error) {
        REQUIRE_THAT(error.what(), Catch::Matchers::ContainsSubstring("add_welfare requires a planner_objective block"));
    }
}

TEST_CASE("complementarity conditions print their slack", "[model_compiler]") {
    const auto model = compile(
        "endogenous i y\n"
        "parameters phi\n"
        "model\n"
        "  i = max(phi*y, 0);\n"
        "  y = 0.5*y{-1} + 1;\n"
        "  mcp i > 0.5;\n"
        "  mcp i <= 2;\n");
    REQUIRE(model.equations_of(libdsge::EquationType::Complementarity).size() == 2);
    REQUIRE(model.routines.complementarity.code == std::vector<std::string>{"y_1-0.5", "2-y_1"});
    REQUIRE(model.routines.functions.dynamic.code.size() == 2);
}

TEST_CASE("transition matrices combine the markov chains", "[model_compiler]") {
    const auto model = compile(
        "endogenous y\n"
        "exogenous e\n"
        "parameters(a,2) rho\n"
        "parameters(b,2) sig\n"
        "parameters a_tp_1_2 a_tp_2_1 b_tp_1_2 b_tp_2_1\n"
        "model\n"
        "  y = rho*y{-1} + sig*e;\n");
    REQUIRE(model.regimes.size() == 4);
    REQUIRE_FALSE(model.flags.is_endogenous_switching);

    libdsge::RoutineEvaluator evaluator;
    evaluator.bind(libdsge::SymbolKind::Parameter, vector_of({0.5, 1.0, 0.1, 0.2, 0.3, 0.4}));
    const Eigen::MatrixXd q = evaluator.transition_matrix(model.routines.transition_matrix, model.regimes.size());
    for (Eigen::Index r = 0; r < 4; ++r) {
        REQUIRE_THAT(q.row(r).sum(), Catch::Matchers::WithinAbs(1.0, 1e-12));
    }
    REQUIRE_THAT(q(0, 0), Catch::Matchers::WithinAbs(0.63, 1e-12));
    REQUIRE_THAT(q(0, 3), Catch::Matchers::WithinAbs(0.03, 1e-12));
}

TEST_CASE("probabilities defined in the model switch endogenously", "[model_compiler]") {
    const auto model = compile(
        "endogenous y\n"
        "parameters(a,2) rho\n"
        "parameters a_tp_2_1\n"
        "model\n"
        "  a_tp_1_2 = 1/(1+exp(-y));\n"
        "  y = rho;\n");
    REQUIRE(model.flags.is_endogenous_switching);
    REQUIRE(model.equations_of(libdsge::EquationType::TimeVaryingProbability).size() == 1);

    libdsge::RoutineEvaluator evaluator;
    evaluator.bind(libdsge::SymbolKind::Endogenous, vector_of({0.0}));
    evaluator.bind(libdsge::SymbolKind::Parameter, vector_of({0.5, 0.25}));
    const Eigen::MatrixXd q = evaluator.transition_matrix(model.routines.transition_matrix, 2);
    REQUIRE_THAT(q(0, 1), Catch::Matchers::WithinAbs(0.5, 1e-12));
    REQUIRE_THAT(q(1, 0), Catch::Matchers::WithinAbs(0.25, 1e-12));
    REQUIRE_THAT(q(1, 1), Catch::Matchers::WithinAbs(0.75, 1e-12));

    REQUIRE(model.routines.derivatives.probabilities.has_value());
    const auto& probabilities = *model.routines.derivatives.probabilities;
    REQUIRE(probabilities.functions.size() == 1);
    REQUIRE(libdsge::render_all(probabilities.wrt) == std::vector<std::string>{"y_1"});
    REQUIRE(probabilities.derivatives.size() == 2);
    const Eigen::MatrixXd gradient(evaluator.evaluate_derivatives(probabilities, 1));
    REQUIRE_THAT(gradient(0, 0), Catch::Matchers::WithinAbs(0.25, 1e-12));

    evaluator.bind(libdsge::SymbolKind::Endogenous, vector_of({1.0}));
    const double s = 1 / (1 + std::exp(-1.0));
    const Eigen::MatrixXd hessian(evaluator.evaluate_derivatives(probabilities, 2));
    REQUIRE_THAT(hessian(0, 0), Catch::Matchers::WithinAbs(s * (1 - s) * (1 - 2 * s), 1e-12));
}

TEST_CASE("exogenous switching has no probability derivatives", "[model_compiler]") {
    const auto model = compile(
        "endogenous y\n"
        "exogenous e\n"
        "parameters(a,2) rho\n"
        "parameters a_tp_1_2 a_tp_2_1\n"
        "model\n"
        "  y = rho*y{-1} + e;\n");
    REQUIRE_FALSE(model.routines.derivatives.probabilities.has_value());
}

TEST_CASE("steady state blocks set the model flags", "[model_compiler]") {
    const auto model = compile(kRbc +
                               "steady_state_model(unique)\n"
                               "  k = 10;\n"
                               "  y = k^alpha;\n"
                               "  c = y - delta*k;\n");
    REQUIRE(model.flags.is_unique_steady_state);
    REQUIRE_FALSE(model.flags.is_param_changed_in_ssmodel);
    REQUIRE(model.routines.steady_state_model.code[0] == "y_2=10");
    REQUIRE(model.routines.steady_state_model.code[1] == "y_3=y_2^param_1");
}

TEST_CASE("ModelCompiler reports errors with their origin", "[model_compiler]") {
    const libdsge::ModelCompiler compiler;
    REQUIRE_THROWS_AS(compiler.compile("endogenous y\n", "m.rs"), libdsge::ModelError);
    REQUIRE_THROWS_AS(compiler.compile(kRbc, "model.txt"), libdsge::ParseError);

    try {
        (void)compiler.compile("endogenous y\nparameters a\n\nmodel\n  y = a*z;\n", "bad.rs");
        FAIL("an unknown symbol should throw");
    } catch (const libdsge::ParseError& error) {
        REQUIRE(error.file() == "bad.rs");
        REQUIRE(error.line() == 5);
        REQUIRE_THAT(error.detail(), Catch::Matchers::ContainsSubstring("unknown symbol 'z'"));
    }
}

TEST_CASE("ModelCompiler writes progress to the log stream", "[model_compiler]") {
    std::ostringstream log;
    libdsge::CompilerOptions options;
    options.log = &log;
    (void)compile(kRbc, options);
    REQUIRE_THAT(log.str(), Catch::Matchers::StartsWith("[libdsge] model: 3 endogenous, 1 exogenous, 3 parameters, 3 equations"));
    REQUIRE_THAT(log.str(), Catch::Matchers::ContainsSubstring("[libdsge] static_derivatives: 3 equations, 3 variables, order 1"));
}

TEST_CASE("CompilerOptions reads key value pairs", "[compiler_options]") {
    const auto options = libdsge::CompilerOptions::from_pairs({{"max_deriv_order", "3"}, {"stationary_model", "TRUE"}});
    REQUIRE(options.max_deriv_order == 3);
    REQUIRE(options.stationary_model == true);
    REQUIRE_FALSE(options.parameter_differentiation);

    REQUIRE_FALSE(libdsge::CompilerOptions::from_pairs({{"stationary_model", ""}}).stationary_model.has_value());
    REQUIRE(libdsge::CompilerOptions::from_pairs({{"add_welfare", "1"}}).add_welfare);

    REQUIRE_THROWS_AS(libdsge::CompilerOptions::from_pairs({{"order", "2"}}), libdsge::ConfigurationError);
    REQUIRE_THROWS_AS(libdsge::CompilerOptions::from_pairs({{"add_welfare", "yes"}}), libdsge::ConfigurationError);
    REQUIRE_THROWS_AS(libdsge::CompilerOptions::from_pairs({{"max_deriv_order", "abc"}}), libdsge::ConfigurationError);
    REQUIRE_THROWS_AS(libdsge::CompilerOptions::from_pairs({{"max_deriv_order", "0"}}), libdsge::ConfigurationError);
    REQUIRE_THROWS_AS(libdsge::CompilerOptions::from_pairs({{"max_deriv_order", " -1"}}), libdsge::ConfigurationError);
    REQUIRE_THROWS_AS(libdsge::CompilerOptions::from_pairs({{"max_deriv_order", " 3"}}), libdsge::ConfigurationError);
    REQUIRE_THROWS_AS(libdsge::CompilerOptions::from_pairs({{"max_deriv_order", "+3"}}), libdsge::ConfigurationError);
    REQUIRE_THROWS_AS(libdsge::CompilerOptions::from_pairs({{"max_deriv_order", ""}}), libdsge::ConfigurationError);

    libdsge::CompilerOptions zero;
    zero.max_deriv_order = 0;
    REQUIRE_THROWS_AS(libdsge::ModelCompiler(zero), libdsge::ConfigurationError);
}

TEST_CASE("observables point at the reordered variables", "[model_compiler]") {
    const auto model = compile(kRbc + "observables y e\n");
    const auto& observables = model.symbols.observables();
    REQUIRE(observables.size() == 2);
    REQUIRE(observables[0].source == libdsge::ObservableSource::Endogenous);
    REQUIRE(observables[0].source_index == 2);
    REQUIRE(observables[1].source == libdsge::ObservableSource::Exogenous);
    REQUIRE(model.symbols.exogenous()[0].is_observed);
}
