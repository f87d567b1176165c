#ifndef COREGRID_HPP
#define COREGRID_HPP

#include <opencv2/opencv.hpp>
#include <string>

#include "config.hpp"
#include "grid_mapper.hpp"

struct ScanReport {
    cv::Size imageSize;
    int cellSize;
    int totalCells;
    cv::Size gridSize;  // normalized extent, 0x0 when nothing was found
    CellMap cells;      // normalized
    GridIndex xIndex;
    GridIndex yIndex;
};

/**
 * Detect, quantize and normalize the cells of an OPB-82 scheme already in memory.
 * @param rgbImage 8-bit RGB image
 * @param config Validated before use; throws std::invalid_argument if it is not
 * @return The normalized report. An image with no matching cells yields an empty report.
 */
ScanReport scanScheme(const cv::Mat& rgbImage, const CoreGridConfig& config);

/**
 * Default JSON output next to the image: same path, .json extension.
 */
std::string defaultReportPath(const std::string& imagePath);

/**
 * TypeScript listing path for a JSON output path: same path, .ts extension.
 */
std::string typeScriptPathFor(const std::string& reportPath);

/**
 * Load an image, scan it and write the JSON report followed by the TypeScript listing.
 * @param imagePath Image to decode
 * @param config Scan configuration
 * @param outputPath JSON destination; empty selects defaultReportPath(imagePath)
 * @return The report that was written. Decode and write failures throw std::runtime_error.
 */
ScanReport runCoreGridForFile(const std::string& imagePath, const CoreGridConfig& config,
                              const std::string& outputPath = "");

struct CommandLine {
    std::string imagePath;
    std::string outputPath;  // empty selects defaultReportPath(imagePath)
    CoreGridConfig config;
};

/**
 * Parse <image_path> [cell_size] [min_area] [output_path].
 * Throws std::invalid_argument when the image path is missing, a number is not an integer, or the
 * resulting configuration does not validate.
 */
CommandLine parseCommandLine(int argc, const char* const argv[]);

/**
 * Command-line entry point: parse, run, report errors to stderr.
 * @return 0 on success, 1 on usage, decode or write errors
 */
int runCoreGridCli(int argc, const char* const argv[]);

#endif  // COREGRID_HPP
