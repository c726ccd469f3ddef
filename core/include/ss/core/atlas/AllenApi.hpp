#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include <opencv2/core.hpp>

#include "ss/core/atlas/HttpTransport.hpp"
#include "ss/core/atlas/IAtlasSource.hpp"

namespace ss::allen {

inline constexpr const char* kDefaultBaseUrl = "http://api.brain-map.org";

// Allen Brain Atlas REST API as an atlas source. Every call is one blocking
// request through `transport`, which must outlive this object. Affines are
// requested in the reference -> image direction (tsv_* / tvr_* coefficients).
class AllenApi : public IAtlasSource
{
public:
    explicit AllenApi(IHttpTransport& transport, std::string baseUrl = kDefaultBaseUrl);

    std::vector<ImageMetadata> imageMetadata(int64_t datasetId) override;
    Affine3D datasetAffine3D(int64_t datasetId) override;
    std::string datasetAxis(int64_t datasetId) override;
    PirPoint imageToReference(double x, double y, int64_t imageId) override;
    cv::Mat image(int64_t imageId, int downsample, bool expression = false) override;

    [[nodiscard]] const std::string& baseUrl() const { return baseUrl_; }

    [[nodiscard]] std::string sectionImagesUrl(int64_t datasetId) const;
    [[nodiscard]] std::string datasetUrl(int64_t datasetId, bool withAlignment3d) const;
    [[nodiscard]] std::string imageToReferenceUrl(double x, double y, int64_t imageId) const;
    [[nodiscard]] std::string imageDownloadUrl(int64_t imageId, int downsample, bool expression) const;

private:
    // GET `url`, check the {"success": true, "msg": ...} envelope, return msg.
    nlohmann::json query(const std::string& url);
    nlohmann::json firstDataset(int64_t datasetId, bool withAlignment3d);

    IHttpTransport& transport_;
    std::string baseUrl_;
};

// [[tsv_00, tsv_01, tsv_04], [tsv_02, tsv_03, tsv_05]]
Affine2D parseAlignment2D(const nlohmann::json& alignment, const std::string& context);
// [[tvr_00, tvr_01, tvr_02, tvr_09], [tvr_03, ..., tvr_10], [tvr_06, ..., tvr_11]]
Affine3D parseAlignment3D(const nlohmann::json& alignment, const std::string& context);
// 1 -> "coronal", 2 -> "sagittal"; anything else throws ss::CollaboratorError.
std::string axisFromPlaneOfSection(int64_t planeOfSectionId);

} // namespace ss::allen
