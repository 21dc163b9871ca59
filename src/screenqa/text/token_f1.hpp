#pragma once

#include <string>
#include <vector>

namespace screenqa {

/// @brief Multiset-overlap F1 between a predicted and a reference token list.
///
/// Tokens are compared by value, order is irrelevant and duplicates count
/// up to the smaller multiplicity. Returns exactly 0 when no token is
/// shared (this also covers empty inputs).
///
/// @param prediction_tokens Tokens of the predicted answer.
/// @param ground_truth_tokens Tokens of the reference answer.
/// @return F1 score in [0, 1].
double token_f1(
    const std::vector<std::string>& prediction_tokens,
    const std::vector<std::string>& ground_truth_tokens);

} // namespace screenqa
