#include "utilities.hpp"

#include <fstream>
#include <stdexcept>

cv::Mat toRgb(const cv::Mat& image, ChannelOrder order) {
    if (image.empty()) {
        throw std::invalid_argument("toRgb: empty image");
    }
    if (image.depth() != CV_8U) {
        throw std::invalid_argument("toRgb: expected 8-bit image, got depth " +
                                    std::to_string(image.depth()));
    }

    cv::Mat rgb;
    switch (image.channels()) {
        case 1:
            cv::cvtColor(image, rgb, cv::COLOR_GRAY2RGB);
            break;
        case 3:
            if (order == ORDER_BGR) {
                cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
            } else {
                rgb = image.clone();
            }
            break;
        case 4:
            cv::cvtColor(image, rgb, order == ORDER_BGR ? cv::COLOR_BGRA2RGB : cv::COLOR_RGBA2RGB);
            break;
        default:
            throw std::invalid_argument("toRgb: unsupported channel count " +
                                        std::to_string(image.channels()));
    }
    return rgb;
}

cv::Mat loadSchemeImage(const std::string& imagePath) {
    // IMREAD_COLOR drops alpha and expands grayscale/palette images to BGR. Pixels stay in stored
    // order: an EXIF orientation tag must not rotate the scheme.
    cv::Mat image = cv::imread(imagePath, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION);
    if (image.empty()) {
        throw std::runtime_error("Could not open image at " + imagePath);
    }
    LOGI("[loadSchemeImage] %s: %dx%d, %d channels", imagePath.c_str(), image.cols, image.rows,
         image.channels());
    return toRgb(image, ORDER_BGR);
}

void writeTextFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open " + path + " for writing");
    }
    out << content;
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing " + path);
    }
    LOGI("[writeTextFile] %zu bytes to %s", content.size(), path.c_str());
}
