#pragma once

#include <utility>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "ss/core/types/ReferenceSpace.hpp"

namespace ss {

// Dense mapping from a reference grid to image pixel coordinates.
// Stored as displacements relative to the identity grid:
//   tx(i, j) = j + deltaX(i, j),  ty(i, j) = i + deltaY(i, j)
class DisplacementField
{
public:
    DisplacementField() = default;
    // Takes ownership of the displacement grids; both must have equal shape.
    DisplacementField(cv::Mat_<float> delta_x, cv::Mat_<float> delta_y);

    // Build from absolute destination coordinates (tx, ty). Accepts any
    // single-channel numeric depth; values are converted to float after the
    // identity grid is subtracted in double precision.
    static DisplacementField fromTransform(const cv::Mat& tx, const cv::Mat& ty);

    [[nodiscard]] GridShape shape() const { return {deltaX_.rows, deltaX_.cols}; }
    [[nodiscard]] bool empty() const { return deltaX_.empty(); }
    [[nodiscard]] const cv::Mat_<float>& deltaX() const { return deltaX_; }
    [[nodiscard]] const cv::Mat_<float>& deltaY() const { return deltaY_; }

    // Absolute destination coordinates (tx, ty).
    [[nodiscard]] std::pair<cv::Mat_<float>, cv::Mat_<float>> transformation() const;

    [[nodiscard]] bool isIdentity() const;

    // Resample `image` onto this field's grid: out(i, j) = image(ty(i,j), tx(i,j)).
    // Samples outside the image take `border_value`.
    [[nodiscard]] cv::Mat warp(const cv::Mat& image,
                               int interpolation = cv::INTER_LINEAR,
                               double border_value = 0) const;

private:
    cv::Mat_<float> deltaX_;
    cv::Mat_<float> deltaY_;
};

} // namespace ss
