#include "ss/core/util/Transform.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "ss/core/util/Errors.hpp"

namespace ss {

DisplacementField compute_transform(double slice_coordinate,
                                    const Affine2D& affine_2d,
                                    const Affine3D& affine_3d,
                                    Axis axis,
                                    int downsample_ref,
                                    int downsample_img)
{
    if (downsample_img < 0)
        throw InvalidArgument("downsample_img must be >= 0, got " + std::to_string(downsample_img));

    const GridShape shape = gridShape(axis, downsample_ref);
    const auto vars = variableAxes(axis);
    const auto fixed = static_cast<int>(axis);
    const auto row_axis = static_cast<int>(vars[0]);
    const auto col_axis = static_cast<int>(vars[1]);
    const double img_scale = std::ldexp(1.0, downsample_img);

    cv::Mat_<float> dx(shape.rows, shape.cols), dy(shape.rows, shape.cols);

    cv::Vec3d ref;
    ref[fixed] = slice_coordinate;
    for (int i = 0; i < shape.rows; ++i) {
        ref[row_axis] = static_cast<double>(i) * downsample_ref;
        float* ox = dx[i];
        float* oy = dy[i];
        for (int j = 0; j < shape.cols; ++j) {
            ref[col_axis] = static_cast<double>(j) * downsample_ref;

            // reference -> section space; the third section coordinate is dropped
            const cv::Vec3d sec = applyAffine(affine_3d, ref);
            // section -> pixel space
            const cv::Vec2d px = applyAffine(affine_2d, cv::Vec2d(sec[0], sec[1]));

            ox[j] = static_cast<float>(px[0] / img_scale - j);
            oy[j] = static_cast<float>(px[1] / img_scale - i);
        }
    }

    return {std::move(dx), std::move(dy)};
}

DisplacementField compute_transform(double slice_coordinate,
                                    const cv::Mat& affine_2d,
                                    const cv::Mat& affine_3d,
                                    std::string_view axis,
                                    int downsample_ref,
                                    int downsample_img)
{
    const Axis a = axisFromName(axis);
    const Affine2D a2 = toAffine2D(affine_2d);
    const Affine3D a3 = toAffine3D(affine_3d);
    return compute_transform(slice_coordinate, a2, a3, a, downsample_ref, downsample_img);
}

} // namespace ss
