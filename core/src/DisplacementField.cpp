#include "ss/core/types/DisplacementField.hpp"

#include <string>

#include "ss/core/util/Errors.hpp"

namespace ss {

static std::string size_str(const cv::Mat& m)
{
    return std::to_string(m.rows) + "x" + std::to_string(m.cols);
}

DisplacementField::DisplacementField(cv::Mat_<float> delta_x, cv::Mat_<float> delta_y)
    : deltaX_(std::move(delta_x)), deltaY_(std::move(delta_y))
{
    if (deltaX_.size() != deltaY_.size()) {
        throw ShapeMismatch("displacement grids differ in shape: " + size_str(deltaX_) +
                            " vs " + size_str(deltaY_));
    }
}

DisplacementField DisplacementField::fromTransform(const cv::Mat& tx, const cv::Mat& ty)
{
    if (tx.dims != 2 || ty.dims != 2 || tx.channels() != 1 || ty.channels() != 1)
        throw ShapeMismatch("transformation grids must be single-channel 2-D matrices");
    if (tx.size() != ty.size())
        throw ShapeMismatch("tx and ty differ in shape: " + size_str(tx) + " vs " + size_str(ty));

    cv::Mat_<double> fx, fy;
    tx.convertTo(fx, CV_64F);
    ty.convertTo(fy, CV_64F);

    cv::Mat_<float> dx(tx.rows, tx.cols), dy(tx.rows, tx.cols);
    for (int i = 0; i < fx.rows; ++i) {
        const double* px = fx[i];
        const double* py = fy[i];
        float* ox = dx[i];
        float* oy = dy[i];
        for (int j = 0; j < fx.cols; ++j) {
            ox[j] = static_cast<float>(px[j] - j);
            oy[j] = static_cast<float>(py[j] - i);
        }
    }
    return {std::move(dx), std::move(dy)};
}

std::pair<cv::Mat_<float>, cv::Mat_<float>> DisplacementField::transformation() const
{
    cv::Mat_<float> tx(deltaX_.rows, deltaX_.cols), ty(deltaX_.rows, deltaX_.cols);
    for (int i = 0; i < deltaX_.rows; ++i) {
        const float* dx = deltaX_[i];
        const float* dy = deltaY_[i];
        float* ox = tx[i];
        float* oy = ty[i];
        for (int j = 0; j < deltaX_.cols; ++j) {
            ox[j] = dx[j] + static_cast<float>(j);
            oy[j] = dy[j] + static_cast<float>(i);
        }
    }
    return {std::move(tx), std::move(ty)};
}

bool DisplacementField::isIdentity() const
{
    return cv::countNonZero(deltaX_) == 0 && cv::countNonZero(deltaY_) == 0;
}

cv::Mat DisplacementField::warp(const cv::Mat& image, int interpolation, double border_value) const
{
    if (image.empty())
        throw InvalidArgument("cannot warp an empty image");
    if (empty())
        throw InvalidArgument("cannot warp with an empty displacement field");

    auto [tx, ty] = transformation();
    cv::Mat out;
    cv::remap(image, out, tx, ty, interpolation, cv::BORDER_CONSTANT, cv::Scalar::all(border_value));
    return out;
}

} // namespace ss
