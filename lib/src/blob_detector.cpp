#include "blob_detector.hpp"

#include <deque>
#include <stdexcept>

#include "utilities.hpp"

BlobDetector::BlobDetector(const ColorMatcher& matcher) : matcher(matcher) {}

std::vector<Blob> BlobDetector::detect(const cv::Mat& rgbImage, const cv::Vec3b& reference) const {
    if (rgbImage.type() != CV_8UC3) {
        throw std::invalid_argument("BlobDetector expects an 8-bit 3-channel RGB image");
    }

    std::vector<Blob> blobs;
    cv::Mat visited = cv::Mat::zeros(rgbImage.rows, rgbImage.cols, CV_8U);

    for (int y = 0; y < rgbImage.rows; ++y) {
        const cv::Vec3b* row = rgbImage.ptr<cv::Vec3b>(y);
        for (int x = 0; x < rgbImage.cols; ++x) {
            if (visited.at<uchar>(y, x) || !matcher.matches(row[x], reference)) {
                continue;
            }
            blobs.push_back(floodFill(rgbImage, reference, visited, x, y));
        }
    }

    LOGI("[BlobDetector] %zu regions for (%d, %d, %d)", blobs.size(), reference[0], reference[1],
         reference[2]);
    return blobs;
}

Blob BlobDetector::floodFill(const cv::Mat& rgbImage, const cv::Vec3b& reference,
                             cv::Mat& visited, int startX, int startY) const {
    static const int dx[4] = {1, -1, 0, 0};
    static const int dy[4] = {0, 0, 1, -1};

    // Pixels are marked when queued, so each one enters the queue at most once.
    std::deque<cv::Point> queue;
    queue.push_back(cv::Point(startX, startY));
    visited.at<uchar>(startY, startX) = 1;

    double sumX = 0.0;
    double sumY = 0.0;
    int count = 0;

    while (!queue.empty()) {
        cv::Point p = queue.front();
        queue.pop_front();

        sumX += p.x;
        sumY += p.y;
        ++count;

        for (int i = 0; i < 4; ++i) {
            int nx = p.x + dx[i];
            int ny = p.y + dy[i];
            if (nx < 0 || nx >= rgbImage.cols || ny < 0 || ny >= rgbImage.rows) {
                continue;
            }
            if (visited.at<uchar>(ny, nx)) {
                continue;
            }
            if (!matcher.matches(rgbImage.at<cv::Vec3b>(ny, nx), reference)) {
                continue;
            }
            visited.at<uchar>(ny, nx) = 1;
            queue.push_back(cv::Point(nx, ny));
        }
    }

    return Blob{cv::Point2d(sumX / count, sumY / count), count};
}
