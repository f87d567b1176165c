#ifndef COLOR_MATCHER_HPP
#define COLOR_MATCHER_HPP

#include <opencv2/opencv.hpp>
#include <string>

#include "config.hpp"

// Enumeration order is the matching order and the output order.
enum CellType { AZ, TK, RR, AR, LAR, USP, CELL_NONE };

constexpr int CELL_TYPE_COUNT = 6;

/**
 * Label used for a cell type in the JSON keys and the TypeScript listing ("AZ", "TK", ...).
 */
std::string cellTypeName(CellType type);

/**
 * Reference color of a cell type, in RGB channel order.
 */
cv::Vec3b cellTypeColor(CellType type);

class ColorMatcher {
   public:
    explicit ColorMatcher(double tolerance = DEFAULT_COLOR_TOLERANCE);

    /**
     * Euclidean distance between two RGB triples
     */
    static double colorDistance(const cv::Vec3b& c1, const cv::Vec3b& c2);

    /**
     * Check a pixel against one reference color
     * @param pixel RGB pixel
     * @param reference RGB reference color
     * @return true if the distance is strictly below the tolerance
     */
    bool matches(const cv::Vec3b& pixel, const cv::Vec3b& reference) const;

    /**
     * Classify a pixel against all reference colors. Types are tried in enumeration order and the
     * first one within tolerance wins, so overlapping references make the result order-dependent.
     * @param pixel RGB pixel
     * @return The matching cell type, or CELL_NONE
     */
    CellType identify(const cv::Vec3b& pixel) const;

    /**
     * Format a cell type's reference color as #RRGGBB
     */
    static std::string hexColor(CellType type);

    double getTolerance() const { return tolerance; }

   private:
    double tolerance;
};

#endif  // COLOR_MATCHER_HPP
