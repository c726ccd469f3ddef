#include "ss/core/sync/DatasetSync.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "ss/core/util/Errors.hpp"
#include "ss/core/util/Logging.hpp"
#include "ss/core/util/Transform.hpp"

namespace ss {

int64_t imageIdOf(const SyncRecord& rec)
{
    return std::visit([](const auto& r) { return r.imageId; }, rec);
}

double sliceCoordinateOf(const SyncRecord& rec)
{
    return std::visit([](const auto& r) { return r.sliceCoordinate; }, rec);
}

const DisplacementField& fieldOf(const SyncRecord& rec)
{
    return std::visit([](const auto& r) -> const DisplacementField& { return r.field; }, rec);
}

void sortBySectionDescending(std::vector<ImageMetadata>& metadata)
{
    std::stable_sort(metadata.begin(), metadata.end(),
                     [](const ImageMetadata& a, const ImageMetadata& b) {
                         return a.sectionNumber > b.sectionNumber;
                     });
}

DatasetSync::iterator::iterator(DatasetSync* sync) : sync_(sync)
{
    ++*this;
}

DatasetSync::iterator& DatasetSync::iterator::operator++()
{
    // Drop the previous record before the next one is produced.
    current_.reset();
    current_ = sync_->next();
    if (!current_)
        sync_ = nullptr;
    return *this;
}

DatasetSync::DatasetSync(IAtlasSource& source, int64_t datasetId, SyncOptions options)
    : source_(source), datasetId_(datasetId), opts_(std::move(options))
{
    if (opts_.downsampleRef < 1)
        throw InvalidArgument("downsample_ref must be >= 1, got " + std::to_string(opts_.downsampleRef));
    if (opts_.downsampleImg < 0)
        throw InvalidArgument("downsample_img must be >= 0, got " + std::to_string(opts_.downsampleImg));
}

void DatasetSync::prepare()
{
    metadata_ = source_.imageMetadata(datasetId_);
    sortBySectionDescending(metadata_);

    affine3d_ = source_.datasetAffine3D(datasetId_);

    const std::string axis = source_.datasetAxis(datasetId_);
    try {
        axis_ = axisFromName(axis);
    } catch (const InvalidArgument& e) {
        throw CollaboratorError("dataset " + std::to_string(datasetId_) + ": " + e.what());
    }

    prepared_ = true;
    Logger()->info("dataset {}: {} images, {} axis", datasetId_, metadata_.size(), axisName(axis_));
}

SyncRecord DatasetSync::produce(const ImageMetadata& meta)
{
    const PirPoint pir = source_.imageToReference(opts_.detectionXY.x, opts_.detectionXY.y, meta.imageId);
    // Assumes the cut is parallel to a reference axis; an oblique slice is not detected.
    const double slice = axis_ == Axis::Coronal ? pir.p : pir.r;

    DisplacementField df = compute_transform(slice, meta.affine2d, affine3d_, axis_,
                                             opts_.downsampleRef, opts_.downsampleImg);

    cv::Mat img = source_.image(meta.imageId, opts_.downsampleImg, false);

    Logger()->debug("image {} (section {}): slice {} grid {}x{}", meta.imageId, meta.sectionNumber,
                    slice, df.shape().rows, df.shape().cols);

    if (!opts_.includeExpression)
        return WithoutExpression{meta.imageId, slice, std::move(img), std::move(df)};

    cv::Mat expr = source_.image(meta.imageId, opts_.downsampleImg, true);
    return WithExpression{meta.imageId, slice, std::move(img), std::move(df), std::move(expr)};
}

std::optional<SyncRecord> DatasetSync::next()
{
    if (finished_)
        return std::nullopt;

    try {
        if (!prepared_)
            prepare();

        if (cursor_ >= metadata_.size()) {
            finished_ = true;
            return std::nullopt;
        }

        SyncRecord rec = produce(metadata_[cursor_]);
        ++cursor_;
        return rec;
    } catch (...) {
        finished_ = true;
        throw;
    }
}

DatasetSync sync_dataset(IAtlasSource& source, int64_t datasetId, const SyncOptions& options)
{
    return DatasetSync(source, datasetId, options);
}

} // namespace ss
