#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <screenqa/assignment/assignment_f1.hpp>
#include <screenqa/geometry/bounding_box.hpp>

#include <string>
#include <vector>

using Catch::Approx;
using screenqa::BoundingBox;

namespace {

double equal_score(const std::string& a, const std::string& b)
{
    return a == b ? 1.0 : 0.0;
}

const screenqa::ScoreFunction<std::string> EQUAL = equal_score;

} // namespace

TEST_CASE("Empty lists", "[assignment]")
{
    const std::vector<std::string> none;
    const std::vector<std::string> one = { "x" };
    CHECK(screenqa::assignment_f1(none, none, EQUAL, 1.0) == 1.0);
    CHECK(screenqa::assignment_f1(none, one, EQUAL, 1.0) == 0.0);
    CHECK(screenqa::assignment_f1(one, none, EQUAL, 1.0) == 0.0);
}

TEST_CASE("Equality scoring is a multiset overlap", "[assignment]")
{
    const std::vector<std::string> pred = { "a", "b", "b" };
    const std::vector<std::string> gt = { "b", "c", "a", "d" };
    // Two matches: P = 2/3, R = 2/4.
    CHECK(screenqa::assignment_f1(pred, gt, EQUAL, 1.0)
          == Approx(2.0 * (2.0 / 3.0) * 0.5 / (2.0 / 3.0 + 0.5)));
    CHECK(screenqa::assignment_f1(pred, pred, EQUAL, 1.0) == 1.0);
    CHECK(screenqa::assignment_f1<std::string, std::string>(
              { "a" }, { "z" }, EQUAL, 1.0)
          == 0.0);
}

TEST_CASE("F1 is symmetric under swapping the lists", "[assignment]")
{
    const std::vector<BoundingBox> a = {
        { 0, 0, 1, 1 }, { 0, 2, 1, 3 }, { 5, 5, 6, 6 }
    };
    const std::vector<BoundingBox> b = { { 0, 0.1, 1, 1.1 }, { 0, 2.5, 1, 3.5 } };
    const auto score = [](const BoundingBox& x, const BoundingBox& y) {
        return screenqa::iou(x, y);
    };
    const double ab = screenqa::assignment_f1(a, b, score, 0.1);
    const double ba = screenqa::assignment_f1(b, a, score, 0.1);
    CHECK(ab == Approx(ba));
    // Two matches: P = 2/3, R = 1.
    CHECK(ab == Approx(0.8));
}

TEST_CASE("Global optimum beats greedy matching", "[assignment]")
{
    // Scores:        gt0   gt1
    //   pred0        0.9   0.5
    //   pred1        0.5   0.0
    // Greedy pairs pred0-gt0 first and leaves pred1 without a valid partner
    // (1 match). The optimal assignment pairs pred0-gt1 and pred1-gt0.
    const std::vector<int> pred = { 0, 1 };
    const std::vector<int> gt = { 0, 1 };
    const screenqa::ScoreFunction<int> score = [](int i, int j) {
        static const double table[2][2] = { { 0.9, 0.5 }, { 0.5, 0.0 } };
        return table[i][j];
    };

    Eigen::MatrixXd scores(2, 2);
    scores << 0.9, 0.5,
              0.5, 0.0;
    CHECK(screenqa::count_assignment_matches(scores, 0.5) == 2);
    CHECK(screenqa::assignment_f1(pred, gt, score, 0.5) == 1.0);
}

TEST_CASE("Sub-threshold pairs are unmatchable", "[assignment]")
{
    Eigen::MatrixXd scores(2, 2);
    scores << 0.05, 0.09,
              0.08, 0.5;
    // Only (1,1) passes 0.1.
    CHECK(screenqa::count_assignment_matches(scores, 0.1) == 1);
    CHECK(screenqa::count_assignment_matches(scores, 0.6) == 0);
}

TEST_CASE("Padding pairings of unequal lists are discarded", "[assignment]")
{
    // Three predictions, one reference: the solver pairs only one row.
    Eigen::MatrixXd scores(3, 1);
    scores << 0.0, 0.7, 0.0;
    CHECK(screenqa::count_assignment_matches(scores, 0.1) == 1);

    Eigen::MatrixXd none = Eigen::MatrixXd::Zero(2, 3);
    CHECK(screenqa::count_assignment_matches(none, 0.1) == 0);
}

TEST_CASE("A non-positive threshold counts every pairing", "[assignment]")
{
    Eigen::MatrixXd none = Eigen::MatrixXd::Zero(2, 3);
    CHECK(screenqa::count_assignment_matches(none, 0.0) == 2);
}

TEST_CASE("F1 from match counts", "[assignment]")
{
    CHECK(screenqa::f1_from_matches(0, 3, 4) == 0.0);
    CHECK(screenqa::f1_from_matches(0, 0, 0) == 0.0);
    CHECK(screenqa::f1_from_matches(2, 2, 2) == 1.0);
    CHECK(screenqa::f1_from_matches(1, 1, 3) == Approx(0.5));
}
