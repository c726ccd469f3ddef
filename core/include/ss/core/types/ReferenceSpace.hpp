#pragma once

#include <array>
#include <string>
#include <string_view>

namespace ss {

// Slicing plane of a dataset. The enumerator order is the order of the
// reference volume axes and decides which axis becomes rows vs columns.
enum class Axis { Coronal = 0, Transverse = 1, Sagittal = 2 };

struct AxisExtent {
    Axis axis;
    std::string_view name;
    int extent;
};

// Native extents of the reference volume (micrometers). Order matters.
inline constexpr std::array<AxisExtent, 3> kReferenceSpace = {{
    {Axis::Coronal,    "coronal",    13200},
    {Axis::Transverse, "transverse", 8000},
    {Axis::Sagittal,   "sagittal",   11400},
}};

// Shape of the reference grid once one axis is held fixed.
struct GridShape {
    int rows = 0;
    int cols = 0;

    [[nodiscard]] long long count() const { return static_cast<long long>(rows) * cols; }
    bool operator==(const GridShape& o) const { return rows == o.rows && cols == o.cols; }
    bool operator!=(const GridShape& o) const { return !(*this == o); }
};

// Throws ss::InvalidArgument for anything but "coronal", "transverse", "sagittal".
Axis axisFromName(std::string_view name);
std::string_view axisName(Axis axis);
int axisExtent(Axis axis);

// The two axes other than `fixed`, in reference-space order.
std::array<Axis, 2> variableAxes(Axis fixed);

// extent / downsample_ref for both variable axes. Integer division, so a
// remainder is dropped rather than rounded.
GridShape gridShape(Axis fixed, int downsample_ref);

} // namespace ss
