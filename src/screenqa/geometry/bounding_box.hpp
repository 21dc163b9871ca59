#pragma once

#include <Eigen/Core>

#include <stdexcept>
#include <string>

namespace screenqa {

/// @brief Axis-aligned rectangle in screen coordinates.
///
/// Coordinates are stored in (y, x) order to match the
/// (ymin, xmin, ymax, xmax) convention of the annotations.
struct BoundingBox {
    BoundingBox() : min(Eigen::Array2d::Zero()), max(Eigen::Array2d::Zero())
    {
    }

    BoundingBox(double ymin, double xmin, double ymax, double xmax)
        : min(ymin, xmin)
        , max(ymax, xmax)
    {
    }

    double ymin() const { return min[0]; }
    double xmin() const { return min[1]; }
    double ymax() const { return max[0]; }
    double xmax() const { return max[1]; }

    /// @brief Area of the box (not clamped, inverted boxes are not checked).
    double area() const { return (max - min).prod(); }

    /// @brief Whether min <= max holds on both axes.
    bool is_valid() const { return (min <= max).all(); }

    bool operator==(const BoundingBox& other) const
    {
        return (min == other.min).all() && (max == other.max).all();
    }

    bool operator!=(const BoundingBox& other) const
    {
        return !(*this == other);
    }

    /// @brief (ymin, xmin)
    Eigen::Array2d min;
    /// @brief (ymax, xmax)
    Eigen::Array2d max;
};

/// @brief Raised when a bounding box has inverted coordinates.
class InvalidBoundingBox : public std::invalid_argument {
public:
    explicit InvalidBoundingBox(const std::string& what)
        : std::invalid_argument(what)
    {
    }
};

/// @brief Throw InvalidBoundingBox unless min <= max on both axes.
void validate_bounding_box(const BoundingBox& box);

/// @brief Intersection over union of two boxes.
///
/// Returns 0 whenever the intersection area is 0, which also covers pairs
/// of zero-area boxes. Boxes are not validated.
double iou(const BoundingBox& a, const BoundingBox& b);

} // namespace screenqa
