#pragma once

#include <screenqa/config.hpp>
#include <screenqa/assignment/assignment_f1.hpp>
#include <screenqa/elements/ui_element.hpp>
#include <screenqa/geometry/bounding_box.hpp>
#include <screenqa/utils/logger.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace screenqa {

/// Text answer reserved for "the question has no answer on this screen".
inline const std::string NO_ANSWER = "<no answer>";

struct TextMetrics {
    // 1 if the normalized prediction equals a normalized ground truth
    int exact_match = 0;
    // Best token F1 over the ground truths
    double f1 = 0;
};

struct ElementListMetrics {
    // 1 if the prediction equals one of the ground truths, order included
    int exact_match = 0;
    // Best assignment F1 over the ground truths
    double f1 = 0;
};

struct BoxedElementMetrics {
    // Best assignment F1 scoring boxes only (content ignored)
    double bbox_f1 = 0;
    // 1 if the prediction matches a ground truth position by position
    int exact_match = 0;
    // Best assignment F1 requiring equal content before IoU counts
    double f1 = 0;
};

/// @brief SQA-S metrics of a free-text prediction.
///
/// Answers are compared after normalize_answer(). NO_ANSWER scores (1, 1)
/// only against a ground-truth set containing NO_ANSWER.
///
/// @param prediction Predicted answer or NO_ANSWER.
/// @param ground_truths Acceptable answers, possibly including NO_ANSWER.
/// @return Exact match and F1.
TextMetrics sqa_text_metrics(
    const std::string& prediction, const std::vector<std::string>& ground_truths);

/// @brief SQA-UIC metrics of a list of UI elements compared by value.
///
/// The empty list means "no answer". Exact match requires an identical,
/// identically ordered ground truth; F1 is order insensitive.
///
/// @param prediction Predicted elements.
/// @param ground_truths Acceptable element lists.
/// @return Exact match and F1.
template <typename Element>
ElementListMetrics sqa_element_list_metrics(
    const std::vector<Element>& prediction,
    const std::vector<std::vector<Element>>& ground_truths)
{
    ElementListMetrics metrics;
    if (prediction.empty()) {
        if (std::any_of(
                ground_truths.begin(), ground_truths.end(),
                [](const std::vector<Element>& gt) { return gt.empty(); })) {
            metrics.exact_match = 1;
            metrics.f1 = 1;
        }
        return metrics;
    }

    const ScoreFunction<Element> equal = [](const Element& a,
                                            const Element& b) {
        return a == b ? 1.0 : 0.0;
    };

    bool any_answer = false;
    for (const auto& gt : ground_truths) {
        if (gt.empty()) continue;
        any_answer = true;
        if (prediction == gt) {
            metrics.exact_match = 1;
        }
        metrics.f1 = std::max(
            metrics.f1, assignment_f1(prediction, gt, equal, /*threshold=*/1.0));
    }
    if (!any_answer) {
        logger().debug("sqa_element_list_metrics: no answerable ground truth");
    }
    return metrics;
}

/// @brief SQA-UIC-BB metrics of a list of UI elements with bounding boxes.
///
/// The empty list means "no answer". Exact match is positional (see
/// elements_exact_match()) and always uses SCREENQA_DEFAULT_IOU_THRESHOLD;
/// both F1 scores use an optimal assignment at iou_threshold.
///
/// @param prediction Predicted elements.
/// @param ground_truths Acceptable element lists.
/// @param iou_threshold Minimum IoU for two boxes to match.
/// @return BBox-F1, exact match and F1.
template <typename Content>
BoxedElementMetrics sqa_boxed_element_metrics(
    const std::vector<UIElement<Content>>& prediction,
    const std::vector<std::vector<UIElement<Content>>>& ground_truths,
    double iou_threshold = SCREENQA_DEFAULT_IOU_THRESHOLD)
{
    using Element = UIElement<Content>;

    BoxedElementMetrics metrics;
    if (prediction.empty()) {
        if (std::any_of(
                ground_truths.begin(), ground_truths.end(),
                [](const std::vector<Element>& gt) { return gt.empty(); })) {
            metrics.bbox_f1 = 1;
            metrics.exact_match = 1;
            metrics.f1 = 1;
        }
        return metrics;
    }

    const ScoreFunction<BoundingBox> box_iou = [](const BoundingBox& a,
                                                  const BoundingBox& b) {
        return iou(a, b);
    };
    const ScoreFunction<Element> content_iou = [](const Element& a,
                                                  const Element& b) {
        return a.content == b.content ? iou(a.bbox, b.bbox) : 0.0;
    };

    std::vector<BoundingBox> prediction_boxes;
    prediction_boxes.reserve(prediction.size());
    for (const auto& element : prediction) {
        prediction_boxes.push_back(element.bbox);
    }

    for (const auto& gt : ground_truths) {
        if (gt.empty()) continue;

        std::vector<BoundingBox> gt_boxes;
        gt_boxes.reserve(gt.size());
        for (const auto& element : gt) {
            gt_boxes.push_back(element.bbox);
        }

        metrics.bbox_f1 = std::max(
            metrics.bbox_f1,
            assignment_f1(prediction_boxes, gt_boxes, box_iou, iou_threshold));
        // Exact match stays at the default threshold whatever the caller asks.
        if (elements_exact_match(prediction, gt)) {
            metrics.exact_match = 1;
        }
        metrics.f1 = std::max(
            metrics.f1,
            assignment_f1(prediction, gt, content_iou, iou_threshold));
    }
    return metrics;
}

} // namespace screenqa
