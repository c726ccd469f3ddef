#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "ss/core/types/Affine.hpp"

namespace ss {

struct ImageMetadata {
    int64_t imageId = 0;
    Affine2D affine2d;          // reference-derived section space -> pixels
    int64_t sectionNumber = 0;  // ordering key only, not contiguous
};

// Reference-space coordinates of a single image pixel.
struct PirPoint {
    double p = 0;
    double i = 0;
    double r = 0;
};

// The atlas services a dataset sync depends on. Every call blocks; failures
// are reported by throwing (ss::CollaboratorError for service problems).
class IAtlasSource {
public:
    virtual ~IAtlasSource() = default;

    // All images of a dataset, in whatever order the service lists them.
    virtual std::vector<ImageMetadata> imageMetadata(int64_t datasetId) = 0;
    virtual Affine3D datasetAffine3D(int64_t datasetId) = 0;
    // One of "coronal", "sagittal", "transverse".
    virtual std::string datasetAxis(int64_t datasetId) = 0;
    virtual PirPoint imageToReference(double x, double y, int64_t imageId) = 0;
    // 8-bit, three channels in OpenCV BGR order, downsampled by 2^downsample.
    virtual cv::Mat image(int64_t imageId, int downsample, bool expression = false) = 0;
};

} // namespace ss
