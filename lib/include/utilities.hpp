#ifndef UTILITIES_HPP
#define UTILITIES_HPP

#include <opencv2/opencv.hpp>
#include <string>

#ifndef COREGRID_DEBUG_OUTPUT
#define COREGRID_DEBUG_OUTPUT 0
#endif

#if COREGRID_DEBUG_OUTPUT
#include <cstdio>
#define LOGI(...)            \
    do {                     \
        printf("INFO: ");    \
        printf(__VA_ARGS__); \
        printf("\n");        \
    } while (0)
#define LOGE(...)                     \
    do {                              \
        fprintf(stderr, "ERROR: ");   \
        fprintf(stderr, __VA_ARGS__); \
        fprintf(stderr, "\n");        \
    } while (0)
#else
#define LOGI(...)
#define LOGE(...)
#endif

// Channel layout of an 8-bit input buffer handed to toRgb().
enum ChannelOrder { ORDER_BGR, ORDER_RGB };

/**
 * Convert a 1-, 3- or 4-channel 8-bit image to 3-channel RGB. Alpha is dropped.
 * @param image Input image
 * @param order Channel layout of 3/4-channel input (OpenCV decoders produce BGR)
 * @return A new RGB image; throws std::invalid_argument for other depths or channel counts
 */
cv::Mat toRgb(const cv::Mat& image, ChannelOrder order);

/**
 * Decode an image file and convert it to RGB.
 * Throws std::runtime_error if the file cannot be opened or decoded.
 */
cv::Mat loadSchemeImage(const std::string& imagePath);

/**
 * Write content to path, replacing any existing file.
 * Throws std::runtime_error if the destination cannot be opened or written.
 */
void writeTextFile(const std::string& path, const std::string& content);

#endif  // UTILITIES_HPP
