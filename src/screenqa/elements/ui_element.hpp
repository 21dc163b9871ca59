#pragma once

#include <screenqa/config.hpp>
#include <screenqa/geometry/bounding_box.hpp>

#include <string>
#include <vector>

namespace screenqa {

/// @brief A UI element selected as (part of) an answer: where it is and what it shows.
template <typename Content = std::string> struct UIElement {
    UIElement() = default;

    UIElement(const BoundingBox& _bbox, const Content& _content)
        : bbox(_bbox)
        , content(_content)
    {
    }

    bool operator==(const UIElement& other) const
    {
        return bbox == other.bbox && content == other.content;
    }

    bool operator!=(const UIElement& other) const
    {
        return !(*this == other);
    }

    BoundingBox bbox;
    Content content;
};

/// @brief Whether two elements show the same content at overlapping places.
/// @return True iff the contents are equal and their IoU is >= iou_threshold.
template <typename Content>
bool elements_match(
    const UIElement<Content>& e1,
    const UIElement<Content>& e2,
    double iou_threshold = SCREENQA_DEFAULT_IOU_THRESHOLD)
{
    return e1.content == e2.content && iou(e1.bbox, e2.bbox) >= iou_threshold;
}

/// @brief Position-wise exact match of two element lists.
///
/// Order sensitive: both lists must have the same length and the i-th
/// elements must match for every i. Lists are expected in a canonical order.
template <typename Content>
bool elements_exact_match(
    const std::vector<UIElement<Content>>& elements1,
    const std::vector<UIElement<Content>>& elements2,
    double iou_threshold = SCREENQA_DEFAULT_IOU_THRESHOLD)
{
    if (elements1.size() != elements2.size()) {
        return false;
    }
    for (size_t i = 0; i < elements1.size(); ++i) {
        if (!elements_match(elements1[i], elements2[i], iou_threshold)) {
            return false;
        }
    }
    return true;
}

} // namespace screenqa
