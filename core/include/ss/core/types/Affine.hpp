#pragma once

#include <opencv2/core.hpp>

namespace ss {

// Section space -> image pixel space. Acts on homogeneous (x, y, 1).
using Affine2D = cv::Matx23d;

// Reference space -> section space. Acts on homogeneous (p, i, r, 1).
using Affine3D = cv::Matx34d;

// Validated conversions from dynamically shaped matrices (any single-channel
// numeric depth). Throw ss::ShapeMismatch unless the shape is 2x3 / 3x4.
Affine2D toAffine2D(const cv::Mat& m);
Affine3D toAffine3D(const cv::Mat& m);

inline cv::Vec2d applyAffine(const Affine2D& a, const cv::Vec2d& p)
{
    return {a(0,0)*p[0] + a(0,1)*p[1] + a(0,2),
            a(1,0)*p[0] + a(1,1)*p[1] + a(1,2)};
}

inline cv::Vec3d applyAffine(const Affine3D& a, const cv::Vec3d& p)
{
    return {a(0,0)*p[0] + a(0,1)*p[1] + a(0,2)*p[2] + a(0,3),
            a(1,0)*p[0] + a(1,1)*p[1] + a(1,2)*p[2] + a(1,3),
            a(2,0)*p[0] + a(2,1)*p[1] + a(2,2)*p[2] + a(2,3)};
}

} // namespace ss
