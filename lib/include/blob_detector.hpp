#ifndef BLOB_DETECTOR_HPP
#define BLOB_DETECTOR_HPP

#include <opencv2/opencv.hpp>
#include <vector>

#include "color_matcher.hpp"

struct Blob {
    cv::Point2d centroid;  // mean of member pixel coordinates
    int area;              // pixel count, always >= 1
};

class BlobDetector {
   public:
    explicit BlobDetector(const ColorMatcher& matcher);

    /**
     * Find every maximal 4-connected region of pixels matching the reference color.
     * Regions are reported in raster order of their first pixel. No area filtering is done here.
     * @param rgbImage 8-bit 3-channel RGB image
     * @param reference RGB reference color
     * @return One Blob per region; throws std::invalid_argument for non-CV_8UC3 input
     */
    std::vector<Blob> detect(const cv::Mat& rgbImage, const cv::Vec3b& reference) const;

   private:
    Blob floodFill(const cv::Mat& rgbImage, const cv::Vec3b& reference, cv::Mat& visited,
                   int startX, int startY) const;

    ColorMatcher matcher;
};

#endif  // BLOB_DETECTOR_HPP
