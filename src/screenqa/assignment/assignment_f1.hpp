#pragma once

#include <Eigen/Core>

#include <cstddef>
#include <functional>
#include <vector>

namespace screenqa {

template <typename A, typename B> struct ScoreFunctionOf {
    using type = std::function<double(const A&, const B&)>;
};

/// @brief Pairwise compatibility score between a predicted and a reference item.
///
/// Spelled through a nested type so that lambdas can be passed where the
/// item types are deduced from the lists.
template <typename A, typename B = A>
using ScoreFunction = typename ScoreFunctionOf<A, B>::type;

/// @brief Harmonic mean of matches/num_predicted and matches/num_reference.
/// @return 0 when there are no matches.
double f1_from_matches(
    size_t matches, size_t num_predicted, size_t num_reference);

/// @brief Number of threshold-passing pairs in a maximum-weight assignment.
///
/// Cells below the threshold are zeroed before solving and pairings that
/// the solver only placed to complete the assignment are discarded.
///
/// @param scores Score matrix (rows: predictions, cols: references).
/// @param threshold Minimum score for a pair to count as a match.
/// @return Number of matched pairs.
size_t count_assignment_matches(const Eigen::MatrixXd& scores, double threshold);

/// @brief F1 between two unordered lists under an optimal one-to-one matching.
///
/// Two empty lists score 1, a single empty list scores 0.
///
/// @param prediction Predicted items.
/// @param ground_truth Reference items.
/// @param score_func Pairwise score of a prediction and a reference.
/// @param threshold Minimum score for a pair to count as a match.
/// @return F1 score in [0, 1].
template <typename A, typename B>
double assignment_f1(
    const std::vector<A>& prediction,
    const std::vector<B>& ground_truth,
    const ScoreFunction<A, B>& score_func,
    double threshold)
{
    if (prediction.empty() && ground_truth.empty()) {
        return 1;
    }
    if (prediction.empty() || ground_truth.empty()) {
        return 0;
    }

    Eigen::MatrixXd scores(prediction.size(), ground_truth.size());
    for (size_t i = 0; i < prediction.size(); ++i) {
        for (size_t j = 0; j < ground_truth.size(); ++j) {
            scores(i, j) = score_func(prediction[i], ground_truth[j]);
        }
    }

    const size_t matches = count_assignment_matches(scores, threshold);
    return f1_from_matches(matches, prediction.size(), ground_truth.size());
}

} // namespace screenqa
