#pragma once

#include <Eigen/Core>

#include <utility>
#include <vector>

namespace screenqa {

/// @brief Solve the rectangular linear sum assignment problem.
///
/// Finds a one-to-one pairing between rows and columns of the cost matrix
/// that minimizes the total cost. When the matrix is not square every row
/// (rows <= cols) or every column (rows > cols) is assigned, so the result
/// always holds min(rows, cols) pairs.
///
/// @param cost Dense cost matrix. Every entry must be finite.
/// @return The (row, col) pairs of the optimal assignment, sorted by row.
/// @throws std::invalid_argument if the matrix contains NaN or infinity.
std::vector<std::pair<int, int>>
linear_sum_assignment(const Eigen::MatrixXd& cost);

/// @brief Maximum-weight variant of linear_sum_assignment().
/// @param weights Dense weight matrix. Every entry must be finite.
/// @return The (row, col) pairs maximizing the total weight, sorted by row.
std::vector<std::pair<int, int>>
maximum_weight_assignment(const Eigen::MatrixXd& weights);

} // namespace screenqa
