#include <gtest/gtest.h>

#include <opencv2/opencv.hpp>
#include <vector>

#include "blob_detector.hpp"
#include "color_matcher.hpp"

namespace {

const cv::Vec3b kBackground(255, 255, 255);

cv::Mat blankImage(int width, int height) {
    return cv::Mat(height, width, CV_8UC3, cv::Scalar(kBackground[0], kBackground[1],
                                                      kBackground[2]));
}

void paint(cv::Mat& image, const cv::Rect& rect, const cv::Vec3b& rgb) {
    image(rect).setTo(cv::Scalar(rgb[0], rgb[1], rgb[2]));
}

}  // namespace

class BlobDetectorTest : public ::testing::Test {
   protected:
    BlobDetectorTest() : detector(ColorMatcher()) {}

    BlobDetector detector;
};

TEST_F(BlobDetectorTest, SeparatesDisjointRegions) {
    cv::Mat image = blankImage(40, 30);
    paint(image, cv::Rect(2, 3, 5, 4), cellTypeColor(AZ));    // x 2..6, y 3..6
    paint(image, cv::Rect(20, 10, 3, 3), cellTypeColor(AZ));  // x 20..22, y 10..12

    std::vector<Blob> blobs = detector.detect(image, cellTypeColor(AZ));
    ASSERT_EQ(blobs.size(), 2u);

    EXPECT_EQ(blobs[0].area, 20);
    EXPECT_NEAR(blobs[0].centroid.x, 4.0, 1e-9);
    EXPECT_NEAR(blobs[0].centroid.y, 4.5, 1e-9);

    EXPECT_EQ(blobs[1].area, 9);
    EXPECT_NEAR(blobs[1].centroid.x, 21.0, 1e-9);
    EXPECT_NEAR(blobs[1].centroid.y, 11.0, 1e-9);

    EXPECT_TRUE(detector.detect(image, cellTypeColor(TK)).empty());
    EXPECT_TRUE(detector.detect(image, cellTypeColor(LAR)).empty());
}

TEST_F(BlobDetectorTest, DiagonalNeighborsStaySeparate) {
    cv::Mat image = blankImage(10, 10);
    image.at<cv::Vec3b>(5, 5) = cellTypeColor(USP);
    image.at<cv::Vec3b>(6, 6) = cellTypeColor(USP);

    std::vector<Blob> blobs = detector.detect(image, cellTypeColor(USP));
    ASSERT_EQ(blobs.size(), 2u);
    EXPECT_EQ(blobs[0].area, 1);
    EXPECT_EQ(blobs[1].area, 1);
    EXPECT_DOUBLE_EQ(blobs[0].centroid.x, 5.0);
    EXPECT_DOUBLE_EQ(blobs[1].centroid.y, 6.0);
}

TEST_F(BlobDetectorTest, ConnectsNonConvexShapes) {
    // U shape: both arms meet only through the bottom row.
    cv::Mat image = blankImage(12, 12);
    paint(image, cv::Rect(1, 1, 2, 8), cellTypeColor(AR));
    paint(image, cv::Rect(7, 1, 2, 8), cellTypeColor(AR));
    paint(image, cv::Rect(1, 9, 8, 2), cellTypeColor(AR));

    std::vector<Blob> blobs = detector.detect(image, cellTypeColor(AR));
    ASSERT_EQ(blobs.size(), 1u);
    EXPECT_EQ(blobs[0].area, 16 + 16 + 16);
    EXPECT_NEAR(blobs[0].centroid.x, 4.5, 1e-9);
}

TEST_F(BlobDetectorTest, RegionTouchingImageBorders) {
    cv::Mat image = blankImage(7, 5);
    paint(image, cv::Rect(0, 0, 7, 5), cellTypeColor(RR));

    std::vector<Blob> blobs = detector.detect(image, cellTypeColor(RR));
    ASSERT_EQ(blobs.size(), 1u);
    EXPECT_EQ(blobs[0].area, 35);
    EXPECT_NEAR(blobs[0].centroid.x, 3.0, 1e-9);
    EXPECT_NEAR(blobs[0].centroid.y, 2.0, 1e-9);
}

TEST_F(BlobDetectorTest, NearColorsJoinTheRegion) {
    cv::Mat image = blankImage(10, 10);
    paint(image, cv::Rect(0, 0, 4, 4), cellTypeColor(TK));
    const cv::Vec3b& tk = cellTypeColor(TK);
    image.at<cv::Vec3b>(4, 0) = cv::Vec3b(tk[0] + 5, tk[1] - 5, tk[2]);

    std::vector<Blob> blobs = detector.detect(image, cellTypeColor(TK));
    ASSERT_EQ(blobs.size(), 1u);
    EXPECT_EQ(blobs[0].area, 17);
}

TEST_F(BlobDetectorTest, EmptyImageHasNoBlobs) {
    cv::Mat image = blankImage(16, 16);
    EXPECT_TRUE(detector.detect(image, cellTypeColor(AZ)).empty());
}

TEST_F(BlobDetectorTest, RejectsNonRgbInput) {
    cv::Mat gray(8, 8, CV_8UC1, cv::Scalar(0));
    EXPECT_THROW(detector.detect(gray, cellTypeColor(AZ)), std::invalid_argument);
}
