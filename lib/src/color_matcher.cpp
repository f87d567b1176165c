#include "color_matcher.hpp"

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace {

struct ColorClass {
    const char* name;
    cv::Vec3b rgb;
};

// Indexed by CellType.
const ColorClass kColorClasses[CELL_TYPE_COUNT] = {
    {"AZ", cv::Vec3b(0xDE, 0x1A, 0x03)},   // emergency rods, red
    {"TK", cv::Vec3b(0xA5, 0xB5, 0xA4)},   // fuel channels, gray-green
    {"RR", cv::Vec3b(0xEB, 0xEB, 0xEB)},   // manual control, light gray
    {"AR", cv::Vec3b(0x01, 0xB1, 0x91)},   // automatic, teal
    {"LAR", cv::Vec3b(0x00, 0x67, 0xCE)},  // local automatic, blue
    {"USP", cv::Vec3b(0xFE, 0xD8, 0x01)},  // shortened absorbers, yellow
};

const ColorClass& colorClass(CellType type) {
    if (type < 0 || type >= CELL_TYPE_COUNT) {
        throw std::invalid_argument("Invalid cell type: " + std::to_string(type));
    }
    return kColorClasses[type];
}

}  // namespace

std::string cellTypeName(CellType type) { return colorClass(type).name; }

cv::Vec3b cellTypeColor(CellType type) { return colorClass(type).rgb; }

ColorMatcher::ColorMatcher(double tolerance) : tolerance(tolerance) {}

double ColorMatcher::colorDistance(const cv::Vec3b& c1, const cv::Vec3b& c2) {
    double dr = static_cast<double>(c1[0]) - c2[0];
    double dg = static_cast<double>(c1[1]) - c2[1];
    double db = static_cast<double>(c1[2]) - c2[2];
    return std::sqrt(dr * dr + dg * dg + db * db);
}

bool ColorMatcher::matches(const cv::Vec3b& pixel, const cv::Vec3b& reference) const {
    return colorDistance(pixel, reference) < tolerance;
}

CellType ColorMatcher::identify(const cv::Vec3b& pixel) const {
    for (int i = 0; i < CELL_TYPE_COUNT; ++i) {
        if (matches(pixel, kColorClasses[i].rgb)) {
            return static_cast<CellType>(i);
        }
    }
    return CELL_NONE;
}

std::string ColorMatcher::hexColor(CellType type) {
    const cv::Vec3b& rgb = colorClass(type).rgb;
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", rgb[0], rgb[1], rgb[2]);
    return buffer;
}
