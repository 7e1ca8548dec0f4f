#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "libdsge/differentiation_list.hpp"

using Positions = std::vector<std::size_t>;

namespace {

Eigen::MatrixXi four_variable_incidence() {
    Eigen::MatrixXi lli(4, 3);
    lli << 0, 3, 0, 1, 4, 7, 0, 5, 8, 2, 6, 0;
    return lli;
}

}  // namespace

TEST_CASE("solution_topology orders variables by type", "[differentiation_list]") {
    const auto list = libdsge::solution_topology(four_variable_incidence(), 2);

    REQUIRE(list.order_var == Positions{1, 3, 2, 4});
    REQUIRE(list.inv_order_var == Positions{1, 3, 2, 4});
    REQUIRE(libdsge::render_all(list.wrt) ==
            std::vector<std::string>{"y_1", "y_2", "y_3", "y_5", "y_4", "y_6", "y_8", "y_7", "x_1", "x_2"});
    REQUIRE(list.steady_state_index == Positions{2, 4, 1, 3, 2, 4, 3, 2});
}

TEST_CASE("solution_topology sizes and locates the partitions", "[differentiation_list]") {
    const auto list = libdsge::solution_topology(four_variable_incidence(), 2);
    const auto& siz = list.sizes;
    REQUIRE(siz.ns == 1);
    REQUIRE(siz.np == 1);
    REQUIRE(siz.nb == 1);
    REQUIRE(siz.nf == 1);
    REQUIRE(siz.ne == 2);
    REQUIRE(siz.nd == 4);
    REQUIRE(siz.nv == 10);

    const auto& loc = list.locations;
    REQUIRE(loc.b_plus == Positions{1});
    REQUIRE(loc.f_plus == Positions{2});
    REQUIRE(loc.s_0 == Positions{3});
    REQUIRE(loc.p_0 == Positions{4});
    REQUIRE(loc.b_0 == Positions{5});
    REQUIRE(loc.f_0 == Positions{6});
    REQUIRE(loc.p_minus == Positions{7});
    REQUIRE(loc.b_minus == Positions{8});
    REQUIRE(loc.e_0 == Positions{9, 10});
    REQUIRE(loc.bf_plus == Positions{1, 2});
    REQUIRE(loc.pb_minus == Positions{7, 8});
    REQUIRE(loc.t_0 == Positions{3, 4, 5, 6});
}

TEST_CASE("solution_topology appends listed parameters", "[differentiation_list]") {
    const auto list = libdsge::solution_topology(four_variable_incidence(), 0, {2, 5});
    REQUIRE(list.sizes.parameters == 2);
    REQUIRE(list.wrt.size() == 10);
    REQUIRE(list.wrt[8].render() == "param_2");
    REQUIRE(list.wrt[9].render() == "param_5");
    REQUIRE(list.sizes.nv == 8);
}

TEST_CASE("solution_topology requires three incidence columns", "[differentiation_list]") {
    REQUIRE_THROWS_AS(libdsge::solution_topology(Eigen::MatrixXi::Ones(2, 2), 0), std::invalid_argument);
}
