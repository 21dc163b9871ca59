#include "bounding_box.hpp"

#include <spdlog/fmt/fmt.h>

namespace screenqa {

void validate_bounding_box(const BoundingBox& box)
{
    if (!box.is_valid()) {
        throw InvalidBoundingBox(fmt::format(
            "invalid bounding box (ymin={}, xmin={}, ymax={}, xmax={})",
            box.ymin(), box.xmin(), box.ymax(), box.xmax()));
    }
}

double iou(const BoundingBox& a, const BoundingBox& b)
{
    const Eigen::Array2d lo = a.min.max(b.min);
    const Eigen::Array2d hi = a.max.min(b.max);
    const double intersection_area = (hi - lo).max(0.0).prod();
    if (intersection_area == 0) {
        return 0;
    }
    return intersection_area / (a.area() + b.area() - intersection_area);
}

} // namespace screenqa
