#include "assignment_f1.hpp"

#include <screenqa/assignment/linear_sum_assignment.hpp>
#include <screenqa/utils/logger.hpp>

namespace screenqa {

double f1_from_matches(
    size_t matches, size_t num_predicted, size_t num_reference)
{
    if (matches == 0) {
        return 0;
    }
    const double precision = double(matches) / double(num_predicted);
    const double recall = double(matches) / double(num_reference);
    return (2 * precision * recall) / (precision + recall);
}

size_t count_assignment_matches(const Eigen::MatrixXd& scores, double threshold)
{
    const Eigen::MatrixXd weights =
        (scores.array() >= threshold).select(scores, 0.0);

    size_t matches = 0;
    for (const auto& [i, j] : maximum_weight_assignment(weights)) {
        if (weights(i, j) >= threshold) {
            ++matches;
        }
    }

    logger().trace(
        "assignment: {}x{} scores, threshold={}, matches={}", scores.rows(),
        scores.cols(), threshold, matches);
    return matches;
}

} // namespace screenqa
