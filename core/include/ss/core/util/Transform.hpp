#pragma once

#include <string_view>

#include <opencv2/core.hpp>

#include "ss/core/types/Affine.hpp"
#include "ss/core/types/DisplacementField.hpp"
#include "ss/core/types/ReferenceSpace.hpp"

namespace ss {

/**
 * Displacement field between the reference space and a section image.
 *
 * Every cell (i, j) of the reference grid (the two axes other than `axis`,
 * each of length extent / downsample_ref) is placed at reference position
 * (i * downsample_ref, j * downsample_ref) with the fixed axis set to
 * `slice_coordinate`, mapped to section space by `affine_3d`, and then to
 * image pixels by `affine_2d`. The pixel coordinates are divided by
 * 2^downsample_img so they address an image downloaded at that level.
 *
 * @param slice_coordinate Value of the `axis` coordinate at which the image was cut
 * @param affine_2d Section space -> pixel space
 * @param affine_3d Reference space -> section space
 * @param axis Axis held constant
 * @param downsample_ref Reference grid stride, >= 1
 * @param downsample_img Power-of-two pixel divisor exponent, >= 0
 * @throws ss::InvalidArgument on a bad downsample factor
 */
DisplacementField compute_transform(double slice_coordinate,
                                    const Affine2D& affine_2d,
                                    const Affine3D& affine_3d,
                                    Axis axis = Axis::Coronal,
                                    int downsample_ref = 1,
                                    int downsample_img = 0);

// Same as above for dynamically shaped matrices and an axis given by name.
// Throws ss::InvalidArgument for an unknown axis and ss::ShapeMismatch for
// matrices that are not 2x3 / 3x4; both before any computation.
DisplacementField compute_transform(double slice_coordinate,
                                    const cv::Mat& affine_2d,
                                    const cv::Mat& affine_3d,
                                    std::string_view axis = "coronal",
                                    int downsample_ref = 1,
                                    int downsample_img = 0);

} // namespace ss
