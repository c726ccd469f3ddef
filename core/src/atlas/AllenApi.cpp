#include "ss/core/atlas/AllenApi.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>

#include "ss/core/util/Errors.hpp"
#include "ss/core/util/LoadJson.hpp"
#include "ss/core/util/Logging.hpp"

namespace ss::allen {

namespace {

// Reply problems surface as CollaboratorError whatever layer noticed them.
template <typename F>
auto reply_guard(F&& f) -> decltype(f())
{
    try {
        return f();
    } catch (const CollaboratorError&) {
        throw;
    } catch (const nlohmann::json::exception& e) {
        throw CollaboratorError(e.what());
    } catch (const std::runtime_error& e) {
        throw CollaboratorError(e.what());
    }
}

std::string coef_name(const char* prefix, int k)
{
    std::ostringstream oss;
    oss << prefix << '_' << std::setw(2) << std::setfill('0') << k;
    return oss.str();
}

double coef(const nlohmann::json& alignment, const char* prefix, int k, const std::string& context)
{
    const auto name = coef_name(prefix, k);
    return json::require_number(alignment, name.c_str(), context);
}

std::string format_number(double v)
{
    std::ostringstream oss;
    oss << std::setprecision(17) << v;
    return oss.str();
}

} // namespace

Affine2D parseAlignment2D(const nlohmann::json& alignment, const std::string& context)
{
    return reply_guard([&] {
        const auto c = [&](int k) { return coef(alignment, "tsv", k, context); };
        return Affine2D(c(0), c(1), c(4),
                        c(2), c(3), c(5));
    });
}

Affine3D parseAlignment3D(const nlohmann::json& alignment, const std::string& context)
{
    return reply_guard([&] {
        const auto c = [&](int k) { return coef(alignment, "tvr", k, context); };
        return Affine3D(c(0), c(1), c(2), c(9),
                        c(3), c(4), c(5), c(10),
                        c(6), c(7), c(8), c(11));
    });
}

std::string axisFromPlaneOfSection(int64_t planeOfSectionId)
{
    switch (planeOfSectionId) {
        case 1: return "coronal";
        case 2: return "sagittal";
        default:
            throw CollaboratorError("unsupported plane_of_section_id " + std::to_string(planeOfSectionId));
    }
}

AllenApi::AllenApi(IHttpTransport& transport, std::string baseUrl)
    : transport_(transport), baseUrl_(std::move(baseUrl))
{
    while (!baseUrl_.empty() && baseUrl_.back() == '/')
        baseUrl_.pop_back();
    if (baseUrl_.empty())
        throw InvalidArgument("Allen API base URL is empty");
}

std::string AllenApi::sectionImagesUrl(int64_t datasetId) const
{
    return baseUrl_ + "/api/v2/data/query.json?criteria=model::SectionImage,rma::criteria,[data_set_id$eq" +
           std::to_string(datasetId) + "],rma::include,alignment2d,rma::options[num_rows$eq2000]";
}

std::string AllenApi::datasetUrl(int64_t datasetId, bool withAlignment3d) const
{
    std::string url = baseUrl_ + "/api/v2/data/query.json?criteria=model::SectionDataSet,rma::criteria,[id$eq" +
                      std::to_string(datasetId) + "]";
    if (withAlignment3d)
        url += ",rma::include,alignment3d";
    return url;
}

std::string AllenApi::imageToReferenceUrl(double x, double y, int64_t imageId) const
{
    return baseUrl_ + "/api/v2/image_to_reference/" + std::to_string(imageId) +
           ".json?x=" + format_number(x) + "&y=" + format_number(y);
}

std::string AllenApi::imageDownloadUrl(int64_t imageId, int downsample, bool expression) const
{
    std::string url = baseUrl_ + "/api/v2/section_image_download/" + std::to_string(imageId) +
                      "?downsample=" + std::to_string(downsample);
    if (expression)
        url += "&view=expression";
    return url;
}

nlohmann::json AllenApi::query(const std::string& url)
{
    const std::string body = transport_.get(url);
    return reply_guard([&] {
        auto reply = json::parse_json(body, url);
        json::require_fields(reply, {"success", "msg"}, url);
        if (!reply["success"].is_boolean() || !reply["success"].get<bool>()) {
            const auto* msg = &reply["msg"];
            throw CollaboratorError("request failed: " + url + ": " +
                                    (msg->is_string() ? msg->get<std::string>() : msg->dump()));
        }
        return reply["msg"];
    });
}

nlohmann::json AllenApi::firstDataset(int64_t datasetId, bool withAlignment3d)
{
    const auto url = datasetUrl(datasetId, withAlignment3d);
    auto msg = query(url);
    if (!msg.is_array() || msg.empty()) {
        throw CollaboratorError("no section dataset with id " + std::to_string(datasetId));
    }
    return msg[0];
}

std::vector<ImageMetadata> AllenApi::imageMetadata(int64_t datasetId)
{
    const auto url = sectionImagesUrl(datasetId);
    const auto msg = query(url);

    return reply_guard([&] {
        if (!msg.is_array())
            throw CollaboratorError("section image list from " + url + " is not an array");

        std::vector<ImageMetadata> out;
        out.reserve(msg.size());
        for (const auto& entry : msg) {
            json::require_fields(entry, {"id", "section_number", "alignment2d"}, url);
            ImageMetadata meta;
            meta.imageId = entry["id"].get<int64_t>();
            meta.sectionNumber = entry["section_number"].get<int64_t>();
            const auto ctx = "alignment2d of image " + std::to_string(meta.imageId);
            meta.affine2d = parseAlignment2D(entry["alignment2d"], ctx);
            out.push_back(meta);
        }
        Logger()->debug("dataset {}: {} section images listed", datasetId, out.size());
        return out;
    });
}

Affine3D AllenApi::datasetAffine3D(int64_t datasetId)
{
    const auto ds = firstDataset(datasetId, true);
    const auto ctx = "alignment3d of dataset " + std::to_string(datasetId);
    return reply_guard([&] {
        json::require_fields(ds, {"alignment3d"}, ctx);
        return parseAlignment3D(ds["alignment3d"], ctx);
    });
}

std::string AllenApi::datasetAxis(int64_t datasetId)
{
    const auto ds = firstDataset(datasetId, false);
    const auto ctx = "section dataset " + std::to_string(datasetId);
    const auto plane = reply_guard([&] {
        return static_cast<int64_t>(json::require_number(ds, "plane_of_section_id", ctx));
    });
    return axisFromPlaneOfSection(plane);
}

PirPoint AllenApi::imageToReference(double x, double y, int64_t imageId)
{
    const auto url = imageToReferenceUrl(x, y, imageId);
    const auto msg = query(url);
    return reply_guard([&] {
        json::require_fields(msg, {"image_to_reference"}, url);
        const auto& pt = msg["image_to_reference"];
        return PirPoint{json::require_number(pt, "x", url),
                        json::require_number(pt, "y", url),
                        json::require_number(pt, "z", url)};
    });
}

cv::Mat AllenApi::image(int64_t imageId, int downsample, bool expression)
{
    if (downsample < 0)
        throw InvalidArgument("downsample must be >= 0, got " + std::to_string(downsample));

    const auto url = imageDownloadUrl(imageId, downsample, expression);
    const std::string body = transport_.get(url);

    std::vector<uchar> buf(body.begin(), body.end());
    cv::Mat img = buf.empty() ? cv::Mat() : cv::imdecode(buf, cv::IMREAD_COLOR);
    if (img.empty()) {
        throw CollaboratorError("cannot decode image from " + url + " (" + std::to_string(body.size()) + " bytes)");
    }
    return img;
}

} // namespace ss::allen
