#ifndef JSON_PARSER_HPP
#define JSON_PARSER_HPP

#include <array>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "color_matcher.hpp"

// Readers for the JSON report written by runCoreGridForFile().

struct ReportMetadata {
    cv::Size imageSize;
    int cellSize;
    int totalCells;
    cv::Size gridSize;
    bool success;
};

typedef std::array<std::vector<std::string>, CELL_TYPE_COUNT> PositionLists;

/**
 * Read the "metadata" section. success is false if any field is missing.
 */
ReportMetadata parseReportMetadata(const std::string& jsonStr);

/**
 * Read the "positions_by_type" section into one "x,y" list per cell type.
 * Types missing from the document come back empty.
 */
PositionLists parsePositionsByType(const std::string& jsonStr);

#endif  // JSON_PARSER_HPP
