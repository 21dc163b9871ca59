// nlohmann::json conversions for answers and metric results.
#pragma once

#include <screenqa/elements/ui_element.hpp>
#include <screenqa/geometry/bounding_box.hpp>
#include <screenqa/metrics/sqa_metrics.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace screenqa {

// Boxes are written as [ymin, xmin, ymax, xmax].
inline void to_json(nlohmann::json& j, const BoundingBox& box)
{
    j = nlohmann::json::array({ box.ymin(), box.xmin(), box.ymax(), box.xmax() });
}

inline void from_json(const nlohmann::json& j, BoundingBox& box)
{
    if (!j.is_array() || j.size() != 4) {
        throw InvalidBoundingBox(
            "bounding box must be an array of 4 numbers, got " + j.dump());
    }
    box = BoundingBox(
        j[0].get<double>(), j[1].get<double>(), j[2].get<double>(),
        j[3].get<double>());
    validate_bounding_box(box);
}

// Elements are written as [box, content].
template <typename Content>
void to_json(nlohmann::json& j, const UIElement<Content>& element)
{
    j = nlohmann::json::array({ element.bbox, element.content });
}

template <typename Content>
void from_json(const nlohmann::json& j, UIElement<Content>& element)
{
    if (!j.is_array() || j.size() != 2) {
        throw std::invalid_argument(
            "UI element must be a [box, content] pair, got " + j.dump());
    }
    element.bbox = j[0].get<BoundingBox>();
    element.content = j[1].get<Content>();
}

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TextMetrics, exact_match, f1)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ElementListMetrics, exact_match, f1)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(BoxedElementMetrics, bbox_f1, exact_match, f1)

} // namespace screenqa
