#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <variant>
#include <vector>

#include <opencv2/core.hpp>

#include "ss/core/atlas/IAtlasSource.hpp"
#include "ss/core/types/Affine.hpp"
#include "ss/core/types/DisplacementField.hpp"
#include "ss/core/types/ReferenceSpace.hpp"

namespace ss {

struct SyncOptions {
    int downsampleRef = 25;               // reference grid stride, >= 1
    cv::Point2d detectionXY{0, 0};        // pixel used to locate the slice plane
    bool includeExpression = false;       // also download expression images
    int downsampleImg = 0;                // images are downsampled by 2^downsampleImg
};

struct WithoutExpression {
    int64_t imageId = 0;
    double sliceCoordinate = 0;   // p for coronal datasets, r otherwise
    cv::Mat image;
    DisplacementField field;
};

struct WithExpression {
    int64_t imageId = 0;
    double sliceCoordinate = 0;
    cv::Mat image;
    DisplacementField field;
    cv::Mat expression;
};

using SyncRecord = std::variant<WithoutExpression, WithExpression>;

int64_t imageIdOf(const SyncRecord& rec);
double sliceCoordinateOf(const SyncRecord& rec);
const DisplacementField& fieldOf(const SyncRecord& rec);

// Pull-based walk over every image of a dataset, highest section number
// first. Nothing touches the atlas source until the first pull; the dataset
// metadata, 3-D affine and axis are then fetched once and kept for the life
// of the object. Each later pull does the work for exactly one image.
//
// An exception thrown by the source propagates out of next() and ends the
// sequence. The object is single pass; sync again to start over.
class DatasetSync
{
public:
    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = SyncRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = SyncRecord*;
        using reference = SyncRecord&;

        iterator() = default;

        reference operator*() { return *current_; }
        pointer operator->() { return &*current_; }
        iterator& operator++();
        void operator++(int) { ++*this; }

        bool operator==(const iterator& o) const { return sync_ == o.sync_; }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        friend class DatasetSync;
        explicit iterator(DatasetSync* sync);

        DatasetSync* sync_ = nullptr;
        std::optional<SyncRecord> current_;
    };

    // `source` must outlive this object.
    DatasetSync(IAtlasSource& source, int64_t datasetId, SyncOptions options = {});

    // Iterators point back at this object, so it stays where it was built.
    DatasetSync(const DatasetSync&) = delete;
    DatasetSync& operator=(const DatasetSync&) = delete;

    // Produce the next record, or nullopt once every image was emitted.
    std::optional<SyncRecord> next();

    iterator begin() { return iterator(this); }
    iterator end() { return {}; }

    [[nodiscard]] int64_t datasetId() const { return datasetId_; }
    [[nodiscard]] const SyncOptions& options() const { return opts_; }
    [[nodiscard]] bool prepared() const { return prepared_; }
    [[nodiscard]] bool finished() const { return finished_; }
    // Available after the first pull.
    [[nodiscard]] std::size_t size() const { return metadata_.size(); }
    [[nodiscard]] std::size_t position() const { return cursor_; }
    [[nodiscard]] Axis axis() const { return axis_; }
    [[nodiscard]] const Affine3D& affine3d() const { return affine3d_; }

private:
    void prepare();
    SyncRecord produce(const ImageMetadata& meta);

    IAtlasSource& source_;
    int64_t datasetId_;
    SyncOptions opts_;

    bool prepared_ = false;
    bool finished_ = false;
    std::vector<ImageMetadata> metadata_;
    std::size_t cursor_ = 0;
    Affine3D affine3d_;
    Axis axis_ = Axis::Coronal;
};

// Lazily sync a whole dataset; see DatasetSync.
DatasetSync sync_dataset(IAtlasSource& source, int64_t datasetId, const SyncOptions& options = {});

// Stable sort by section number, highest first.
void sortBySectionDescending(std::vector<ImageMetadata>& metadata);

} // namespace ss
