#include "sqa_metrics.hpp"

#include <screenqa/text/normalize.hpp>
#include <screenqa/text/token_f1.hpp>

namespace screenqa {

TextMetrics sqa_text_metrics(
    const std::string& prediction, const std::vector<std::string>& ground_truths)
{
    TextMetrics metrics;
    if (prediction == NO_ANSWER) {
        if (std::find(ground_truths.begin(), ground_truths.end(), NO_ANSWER)
            != ground_truths.end()) {
            metrics.exact_match = 1;
            metrics.f1 = 1;
        }
        return metrics;
    }

    const std::string normalized_prediction = normalize_answer(prediction);
    const std::vector<std::string> prediction_tokens =
        split_tokens(normalized_prediction);

    bool any_answer = false;
    for (const auto& gt : ground_truths) {
        if (gt == NO_ANSWER) continue;
        any_answer = true;
        const std::string normalized_gt = normalize_answer(gt);
        if (normalized_prediction == normalized_gt) {
            metrics.exact_match = 1;
        }
        metrics.f1 = std::max(
            metrics.f1, token_f1(prediction_tokens, split_tokens(normalized_gt)));
    }
    if (!any_answer) {
        logger().debug("sqa_text_metrics: no answerable ground truth");
    }
    return metrics;
}

} // namespace screenqa
