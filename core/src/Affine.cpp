#include "ss/core/types/Affine.hpp"

#include <string>

#include "ss/core/util/Errors.hpp"

namespace ss {

static std::string shape_str(const cv::Mat& m)
{
    return std::to_string(m.rows) + "x" + std::to_string(m.cols) +
           (m.channels() > 1 ? "x" + std::to_string(m.channels()) : "");
}

template <int R, int C>
static cv::Matx<double, R, C> to_matx(const cv::Mat& m, const char* what)
{
    if (m.dims != 2 || m.rows != R || m.cols != C || m.channels() != 1) {
        throw ShapeMismatch(std::string(what) + " must be " + std::to_string(R) + "x" +
                            std::to_string(C) + ", got " + shape_str(m));
    }
    cv::Mat_<double> d;
    m.convertTo(d, CV_64F);

    cv::Matx<double, R, C> out;
    for (int r = 0; r < R; ++r)
        for (int c = 0; c < C; ++c)
            out(r, c) = d(r, c);
    return out;
}

Affine2D toAffine2D(const cv::Mat& m)
{
    return to_matx<2, 3>(m, "affine_2d");
}

Affine3D toAffine3D(const cv::Mat& m)
{
    return to_matx<3, 4>(m, "affine_3d");
}

} // namespace ss
