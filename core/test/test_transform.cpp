#include "test.hpp"

#include <opencv2/core.hpp>

#include "ss/core/util/Errors.hpp"
#include "ss/core/util/Transform.hpp"

using namespace ss;

// Affine3D sending the row axis of `fixed` to section y and the column axis
// to section x, ignoring the fixed axis.
static Affine3D canonical_embedding(Axis fixed)
{
    auto vars = variableAxes(fixed);
    Affine3D a = Affine3D::zeros();
    a(0, static_cast<int>(vars[1])) = 1.0;
    a(1, static_cast<int>(vars[0])) = 1.0;
    a(2, 3) = 1.0;
    return a;
}

static const Affine2D kIdentity2D(1, 0, 0,
                                  0, 1, 0);

// Straight 4xN -> 3xN -> 2xN evaluation with cv::Mat products.
static void reference_transform(double slice, const Affine2D& a2, const Affine3D& a3, Axis axis,
                                int ds_ref, int ds_img, cv::Mat_<double>& tx, cv::Mat_<double>& ty)
{
    auto shape = gridShape(axis, ds_ref);
    auto vars = variableAxes(axis);
    const int n = shape.rows * shape.cols;

    cv::Mat_<double> ref(4, n, 1.0);
    for (int k = 0; k < n; ++k) {
        ref(static_cast<int>(axis), k) = slice;
        ref(static_cast<int>(vars[0]), k) = (k / shape.cols) * ds_ref;
        ref(static_cast<int>(vars[1]), k) = (k % shape.cols) * ds_ref;
    }

    cv::Mat_<double> sec = cv::Mat(a3) * ref;
    cv::Mat_<double> tmp(3, n, 1.0);
    sec.rowRange(0, 2).copyTo(tmp.rowRange(0, 2));
    cv::Mat_<double> img = cv::Mat(a2) * tmp;

    const double scale = 1 << ds_img;
    tx = img.row(0).clone().reshape(1, shape.rows) / scale;
    ty = img.row(1).clone().reshape(1, shape.rows) / scale;
}

// --- shape -------------------------------------------------------------------

TEST(ComputeTransform, ShapeMatchesGridForEveryAxis)
{
    for (const auto& a : kReferenceSpace) {
        auto df = compute_transform(100.0, kIdentity2D, canonical_embedding(a.axis), a.axis, 50, 0);
        EXPECT_TRUE(df.shape() == gridShape(a.axis, 50));
        EXPECT_EQ(df.deltaX().total(), static_cast<size_t>(gridShape(a.axis, 50).count()));
    }
}

TEST(ComputeTransform, CoronalShapeIsTransverseBySagittal)
{
    auto df = compute_transform(0.0, kIdentity2D, canonical_embedding(Axis::Coronal), Axis::Coronal, 25, 0);
    EXPECT_EQ(df.shape().rows, 320);
    EXPECT_EQ(df.shape().cols, 456);
}

// --- identity law ------------------------------------------------------------

TEST(ComputeTransform, IdentityLawForEveryAxis)
{
    const int ds = 40;
    for (const auto& a : kReferenceSpace) {
        auto df = compute_transform(1234.5, kIdentity2D, canonical_embedding(a.axis), a.axis, ds, 0);
        auto [tx, ty] = df.transformation();
        for (int i = 0; i < tx.rows; i += 17) {
            for (int j = 0; j < tx.cols; j += 13) {
                EXPECT_FLOAT_EQ(tx(i, j), j * ds);
                EXPECT_FLOAT_EQ(ty(i, j), i * ds);
            }
        }
        EXPECT_FLOAT_EQ(tx(tx.rows - 1, tx.cols - 1), (tx.cols - 1) * ds);
        EXPECT_FLOAT_EQ(ty(ty.rows - 1, ty.cols - 1), (ty.rows - 1) * ds);
    }
}

TEST(ComputeTransform, StrideUndoneByImageDownsampleIsIdentity)
{
    // A reference stride of 16 and an image divisor of 2^4 cancel exactly.
    auto df = compute_transform(0.0, kIdentity2D, canonical_embedding(Axis::Sagittal), Axis::Sagittal, 16, 4);
    EXPECT_TRUE(df.shape() == (GridShape{825, 500}));
    EXPECT_TRUE(df.isIdentity());
}

// --- slice coordinate and affine composition ---------------------------------

TEST(ComputeTransform, FixedAxisUsesSliceCoordinate)
{
    // section x = p (the fixed axis for coronal), section y = i
    Affine3D a3 = Affine3D::zeros();
    a3(0, 0) = 1.0;
    a3(1, 1) = 1.0;

    auto df = compute_transform(777.0, kIdentity2D, a3, Axis::Coronal, 100, 0);
    auto [tx, ty] = df.transformation();
    EXPECT_NEAR(tx(0, 0), 777.0, 1e-3);
    EXPECT_NEAR(tx(5, 9), 777.0, 1e-3);
    EXPECT_NEAR(ty(5, 9), 500.0, 1e-3);
}

TEST(ComputeTransform, AppliesTwoDimensionalAffineAfterSectionSpace)
{
    const Affine2D a2(2, 0, 5,
                      0, 3, -7);
    const int ds = 100;
    auto df = compute_transform(0.0, a2, canonical_embedding(Axis::Coronal), Axis::Coronal, ds, 0);
    auto [tx, ty] = df.transformation();
    EXPECT_NEAR(tx(3, 4), 2.0 * 4 * ds + 5, 1e-3);
    EXPECT_NEAR(ty(3, 4), 3.0 * 3 * ds - 7, 1e-3);
}

TEST(ComputeTransform, ThirdSectionRowIsIgnored)
{
    Affine3D a3 = canonical_embedding(Axis::Transverse);
    auto base = compute_transform(50.0, kIdentity2D, a3, Axis::Transverse, 200, 0);

    a3(2, 0) = 123.0;
    a3(2, 1) = -4.0;
    a3(2, 3) = 99.0;
    auto changed = compute_transform(50.0, kIdentity2D, a3, Axis::Transverse, 200, 0);

    EXPECT_EQ(cv::norm(base.deltaX(), changed.deltaX(), cv::NORM_INF), 0.0);
    EXPECT_EQ(cv::norm(base.deltaY(), changed.deltaY(), cv::NORM_INF), 0.0);
}

TEST(ComputeTransform, MatchesMatrixProductEvaluation)
{
    const Affine3D a3(0.91, -0.02, 0.03, 12.5,
                      0.01, 1.07, -0.04, -30.0,
                      0.05, 0.02, 0.98, 4.0);
    const Affine2D a2(0.35, 0.01, -20.0,
                      -0.02, 0.33, 15.0);

    for (const auto& a : kReferenceSpace) {
        for (int ds_img : {0, 2}) {
            auto df = compute_transform(5600.0, a2, a3, a.axis, 200, ds_img);
            auto [tx, ty] = df.transformation();

            cv::Mat_<double> ex, ey;
            reference_transform(5600.0, a2, a3, a.axis, 200, ds_img, ex, ey);

            ASSERT_EQ(tx.rows, ex.rows);
            ASSERT_EQ(tx.cols, ex.cols);
            cv::Mat_<double> txd, tyd;
            tx.convertTo(txd, CV_64F);
            ty.convertTo(tyd, CV_64F);
            EXPECT_LT(cv::norm(txd, ex, cv::NORM_INF), 1e-3);
            EXPECT_LT(cv::norm(tyd, ey, cv::NORM_INF), 1e-3);
        }
    }
}

// --- image downsampling ------------------------------------------------------

TEST(ComputeTransform, DoublingImageDownsampleHalvesCoordinates)
{
    const Affine3D a3(0.9, 0.1, 0.2, 10.0,
                      0.1, 1.1, 0.0, -5.0,
                      0.0, 0.0, 1.0, 0.0);
    const Affine2D a2(0.5, 0.0, 3.0,
                      0.0, 0.5, 8.0);

    auto d0 = compute_transform(300.0, a2, a3, Axis::Coronal, 100, 0).transformation();
    auto d1 = compute_transform(300.0, a2, a3, Axis::Coronal, 100, 1).transformation();
    auto d2 = compute_transform(300.0, a2, a3, Axis::Coronal, 100, 2).transformation();

    for (int i = 0; i < d0.first.rows; i += 7) {
        for (int j = 0; j < d0.first.cols; j += 11) {
            EXPECT_NEAR(d1.first(i, j), d0.first(i, j) / 2, 1e-3);
            EXPECT_NEAR(d1.second(i, j), d0.second(i, j) / 2, 1e-3);
            EXPECT_NEAR(d2.first(i, j), d1.first(i, j) / 2, 1e-3);
            EXPECT_NEAR(d2.second(i, j), d1.second(i, j) / 2, 1e-3);
        }
    }
}

// --- dynamic matrices and errors ---------------------------------------------

TEST(ComputeTransform, AcceptsDynamicMatricesOfAnyDepth)
{
    cv::Mat a2 = (cv::Mat_<float>(2, 3) << 1, 0, 0, 0, 1, 0);
    cv::Mat a3 = cv::Mat(canonical_embedding(Axis::Coronal));
    auto df = compute_transform(0.0, a2, a3, "coronal", 100, 0);
    auto [tx, ty] = df.transformation();
    EXPECT_FLOAT_EQ(tx(2, 3), 300.0f);
    EXPECT_FLOAT_EQ(ty(2, 3), 200.0f);
}

TEST(ComputeTransform, UnknownAxisThrowsBeforeComputing)
{
    cv::Mat a2 = cv::Mat(kIdentity2D);
    cv::Mat a3 = cv::Mat(canonical_embedding(Axis::Coronal));
    EXPECT_THROW(compute_transform(0.0, a2, a3, "axial", 1, 0), InvalidArgument);
    EXPECT_THROW(compute_transform(0.0, a2, a3, "", 1, 0), InvalidArgument);
    // the axis is rejected even when the matrices are malformed too
    EXPECT_THROW(compute_transform(0.0, cv::Mat(), cv::Mat(), "axial", 1, 0), InvalidArgument);
}

TEST(ComputeTransform, WrongMatrixShapesThrow)
{
    cv::Mat good2 = cv::Mat(kIdentity2D);
    cv::Mat good3 = cv::Mat(canonical_embedding(Axis::Coronal));

    cv::Mat eye33 = cv::Mat::eye(3, 3, CV_64F);
    cv::Mat eye32 = cv::Mat::eye(3, 2, CV_64F);
    cv::Mat eye44 = cv::Mat::eye(4, 4, CV_64F);
    cv::Mat two_channel(2, 3, CV_64FC2, cv::Scalar::all(0));

    EXPECT_THROW(compute_transform(0.0, eye33, good3, "coronal", 25, 0), ShapeMismatch);
    EXPECT_THROW(compute_transform(0.0, eye32, good3, "coronal", 25, 0), ShapeMismatch);
    EXPECT_THROW(compute_transform(0.0, good2, eye44, "coronal", 25, 0), ShapeMismatch);
    EXPECT_THROW(compute_transform(0.0, good2, cv::Mat(), "coronal", 25, 0), ShapeMismatch);
    EXPECT_THROW(compute_transform(0.0, two_channel, good3, "coronal", 25, 0),
                 ShapeMismatch);
}

TEST(ComputeTransform, BadDownsampleFactorsThrow)
{
    const auto a3 = canonical_embedding(Axis::Coronal);
    EXPECT_THROW(compute_transform(0.0, kIdentity2D, a3, Axis::Coronal, 0, 0), InvalidArgument);
    EXPECT_THROW(compute_transform(0.0, kIdentity2D, a3, Axis::Coronal, -25, 0), InvalidArgument);
    EXPECT_THROW(compute_transform(0.0, kIdentity2D, a3, Axis::Coronal, 25, -1), InvalidArgument);
}
