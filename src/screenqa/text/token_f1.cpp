#include "token_f1.hpp"

#include <screenqa/assignment/assignment_f1.hpp>

#include <unordered_map>

namespace screenqa {

double token_f1(
    const std::vector<std::string>& prediction_tokens,
    const std::vector<std::string>& ground_truth_tokens)
{
    std::unordered_map<std::string, size_t> counts;
    for (const auto& token : ground_truth_tokens) {
        ++counts[token];
    }

    size_t num_same = 0;
    for (const auto& token : prediction_tokens) {
        auto it = counts.find(token);
        if (it != counts.end() && it->second > 0) {
            --it->second;
            ++num_same;
        }
    }

    return f1_from_matches(
        num_same, prediction_tokens.size(), ground_truth_tokens.size());
}

} // namespace screenqa
