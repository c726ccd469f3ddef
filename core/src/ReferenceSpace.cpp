#include "ss/core/types/ReferenceSpace.hpp"

#include "ss/core/util/Errors.hpp"

namespace ss {

Axis axisFromName(std::string_view name)
{
    for (const auto& a : kReferenceSpace) {
        if (a.name == name)
            return a.axis;
    }
    throw InvalidArgument("unknown axis '" + std::string(name) +
                          "', expected coronal, transverse or sagittal");
}

std::string_view axisName(Axis axis)
{
    return kReferenceSpace[static_cast<size_t>(axis)].name;
}

int axisExtent(Axis axis)
{
    return kReferenceSpace[static_cast<size_t>(axis)].extent;
}

std::array<Axis, 2> variableAxes(Axis fixed)
{
    std::array<Axis, 2> out{};
    size_t n = 0;
    for (const auto& a : kReferenceSpace) {
        if (a.axis != fixed)
            out[n++] = a.axis;
    }
    return out;
}

GridShape gridShape(Axis fixed, int downsample_ref)
{
    if (downsample_ref < 1)
        throw InvalidArgument("downsample_ref must be >= 1, got " + std::to_string(downsample_ref));

    const auto vars = variableAxes(fixed);
    return {axisExtent(vars[0]) / downsample_ref, axisExtent(vars[1]) / downsample_ref};
}

} // namespace ss
