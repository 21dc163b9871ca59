#include "linear_sum_assignment.hpp"

#include <screenqa/utils/logger.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace screenqa {

namespace {
    // Hungarian algorithm with row/column potentials (shortest augmenting
    // paths). Requires cost.rows() <= cost.cols(). Indices are 1-based
    // internally; column 0 is the virtual source of each augmentation.
    std::vector<int> solve_wide(const Eigen::MatrixXd& cost)
    {
        const int n = static_cast<int>(cost.rows());
        const int m = static_cast<int>(cost.cols());
        const double inf = std::numeric_limits<double>::infinity();

        std::vector<double> u(n + 1, 0.0), v(m + 1, 0.0);
        std::vector<int> p(m + 1, 0), way(m + 1, 0);

        for (int i = 1; i <= n; ++i) {
            p[0] = i;
            int j0 = 0;
            std::vector<double> minv(m + 1, inf);
            std::vector<char> used(m + 1, false);
            do {
                used[j0] = true;
                const int i0 = p[j0];
                double delta = inf;
                int j1 = 0;
                for (int j = 1; j <= m; ++j) {
                    if (used[j]) continue;
                    const double cur = cost(i0 - 1, j - 1) - u[i0] - v[j];
                    if (cur < minv[j]) {
                        minv[j] = cur;
                        way[j] = j0;
                    }
                    if (minv[j] < delta) {
                        delta = minv[j];
                        j1 = j;
                    }
                }
                for (int j = 0; j <= m; ++j) {
                    if (used[j]) {
                        u[p[j]] += delta;
                        v[j] -= delta;
                    } else {
                        minv[j] -= delta;
                    }
                }
                j0 = j1;
            } while (p[j0] != 0);
            do {
                const int j1 = way[j0];
                p[j0] = p[j1];
                j0 = j1;
            } while (j0 != 0);
        }

        // row_to_col[i] is the column assigned to row i.
        std::vector<int> row_to_col(n, -1);
        for (int j = 1; j <= m; ++j) {
            if (p[j] != 0) row_to_col[p[j] - 1] = j - 1;
        }
        return row_to_col;
    }
} // namespace

std::vector<std::pair<int, int>>
linear_sum_assignment(const Eigen::MatrixXd& cost)
{
    std::vector<std::pair<int, int>> pairs;
    if (cost.size() == 0) {
        return pairs;
    }
    if (!cost.allFinite()) {
        logger().warn(
            "linear_sum_assignment: cost matrix ({}x{}) contains invalid "
            "numeric entries",
            cost.rows(), cost.cols());
        throw std::invalid_argument(
            "cost matrix contains invalid numeric entries");
    }

    const bool transposed = cost.rows() > cost.cols();
    const std::vector<int> assigned =
        transposed ? solve_wide(cost.transpose()) : solve_wide(cost);

    pairs.reserve(assigned.size());
    for (int i = 0; i < static_cast<int>(assigned.size()); ++i) {
        if (transposed) {
            pairs.emplace_back(assigned[i], i);
        } else {
            pairs.emplace_back(i, assigned[i]);
        }
    }
    std::sort(pairs.begin(), pairs.end());
    return pairs;
}

std::vector<std::pair<int, int>>
maximum_weight_assignment(const Eigen::MatrixXd& weights)
{
    return linear_sum_assignment(-weights);
}

} // namespace screenqa
