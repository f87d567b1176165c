#include "coregrid.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "blob_detector.hpp"
#include "color_matcher.hpp"
#include "report_writer.hpp"
#include "utilities.hpp"

namespace fs = std::filesystem;
using namespace std;

void CoreGridConfig::validate() const {
    if (cellSize <= 0) {
        throw invalid_argument("cell size must be positive, got " + to_string(cellSize));
    }
    if (minArea < 0) {
        throw invalid_argument("minimum area must not be negative, got " + to_string(minArea));
    }
    if (colorTolerance <= 0.0) {
        throw invalid_argument("color tolerance must be positive");
    }
}

static void printCellCounts(const CellMap& cells) {
    for (int t = 0; t < CELL_TYPE_COUNT; ++t) {
        cout << cellTypeName(static_cast<CellType>(t)) << ": " << cells[t].size() << " cells"
             << endl;
    }
    cout << "Total: " << totalCellCount(cells) << " cells" << endl;
}

ScanReport scanScheme(const cv::Mat& rgbImage, const CoreGridConfig& config) {
    config.validate();

    ColorMatcher matcher(config.colorTolerance);
    BlobDetector detector(matcher);

    CellMap rawCells;
    for (int t = 0; t < CELL_TYPE_COUNT; ++t) {
        CellType type = static_cast<CellType>(t);
        cout << "Finding " << cellTypeName(type) << " cells (color: "
             << ColorMatcher::hexColor(type) << ")..." << endl;

        vector<Blob> blobs = detector.detect(rgbImage, cellTypeColor(type));
        for (const auto& blob : blobs) {
            if (blob.area < config.minArea) {
                LOGI("[scanScheme] %s: dropped %d px blob at (%.1f, %.1f)",
                     cellTypeName(type).c_str(), blob.area, blob.centroid.x, blob.centroid.y);
                continue;
            }
            cv::Point grid = quantize(blob.centroid, config.cellSize);
            Cell cell;
            cell.type = type;
            cell.gridX = grid.x;
            cell.gridY = grid.y;
            cell.originalGridX = grid.x;
            cell.originalGridY = grid.y;
            cell.pixelCenter = blob.centroid;
            cell.area = blob.area;
            rawCells[t].push_back(cell);
        }
    }

    cout << endl << "=== Raw Cell Statistics ===" << endl;
    printCellCounts(rawCells);

    NormalizationResult normalized = normalizeCoordinates(rawCells);

    cout << endl << "Coordinate normalization:" << endl;
    if (normalized.xIndex.empty()) {
        cout << "  No cells detected, nothing to normalize" << endl;
    } else {
        const auto& xs = normalized.xIndex.sortedValues();
        const auto& ys = normalized.yIndex.sortedValues();
        cout << "  Original X range: " << xs.front() << " - " << xs.back() << " (" << xs.size()
             << " unique values)" << endl;
        cout << "  Original Y range: " << ys.front() << " - " << ys.back() << " (" << ys.size()
             << " unique values)" << endl;
        cout << "  New X range: 0 - " << xs.size() - 1 << endl;
        cout << "  New Y range: 0 - " << ys.size() - 1 << endl;
    }

    cout << endl << "=== Normalized Cell Statistics ===" << endl;
    printCellCounts(normalized.cells);

    ScanReport report;
    report.imageSize = rgbImage.size();
    report.cellSize = config.cellSize;
    report.totalCells = totalCellCount(normalized.cells);
    report.gridSize = gridExtent(normalized.cells);
    report.cells = normalized.cells;
    report.xIndex = normalized.xIndex;
    report.yIndex = normalized.yIndex;

    cout << "Grid size: " << report.gridSize.width << " x " << report.gridSize.height << endl;
    return report;
}

string defaultReportPath(const string& imagePath) {
    return fs::path(imagePath).replace_extension(".json").string();
}

string typeScriptPathFor(const string& reportPath) {
    return fs::path(reportPath).replace_extension(".ts").string();
}

ScanReport runCoreGridForFile(const string& imagePath, const CoreGridConfig& config,
                              const string& outputPath) {
    config.validate();

    cout << "Loading image: " << imagePath << endl;
    cv::Mat rgbImage = loadSchemeImage(imagePath);
    cout << "Image size: " << rgbImage.cols << "x" << rgbImage.rows << endl;

    ScanReport report = scanScheme(rgbImage, config);

    string reportPath = outputPath.empty() ? defaultReportPath(imagePath) : outputPath;
    writeTextFile(reportPath, formatReportJson(report));
    cout << endl << "Output saved to: " << reportPath << endl;

    string tsPath = typeScriptPathFor(reportPath);
    writeTextFile(tsPath, formatTypeScript(report.cells));
    cout << "TypeScript code saved to: " << tsPath << endl;

    return report;
}

static void printUsage(const char* program) {
    cerr << "Usage: " << program << " <image_path> [cell_size] [min_area] [output_path]" << endl;
    cerr << endl << "Example:" << endl;
    cerr << "  " << program << " opb82_scheme.png " << DEFAULT_CELL_SIZE << " "
         << DEFAULT_MIN_AREA << endl;
}

static int parseIntArgument(const char* value, const char* name) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw invalid_argument(string(name) + " must be an integer, got '" + value + "'");
    }
    if (value[consumed] != '\0') {
        throw invalid_argument(string(name) + " must be an integer, got '" + value + "'");
    }
    return parsed;
}

CommandLine parseCommandLine(int argc, const char* const argv[]) {
    if (argc < 2) {
        throw invalid_argument("missing image path");
    }

    CommandLine commandLine;
    commandLine.imagePath = argv[1];
    if (argc > 2) commandLine.config.cellSize = parseIntArgument(argv[2], "cell_size");
    if (argc > 3) commandLine.config.minArea = parseIntArgument(argv[3], "min_area");
    if (argc > 4) commandLine.outputPath = argv[4];
    commandLine.config.validate();
    return commandLine;
}

int runCoreGridCli(int argc, const char* const argv[]) {
    const char* program = argc > 0 ? argv[0] : "coregrid";

    CommandLine commandLine;
    try {
        commandLine = parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        LOGE("%s", e.what());
        cerr << "Error: " << e.what() << endl;
        printUsage(program);
        return 1;
    }

    try {
        runCoreGridForFile(commandLine.imagePath, commandLine.config, commandLine.outputPath);
    } catch (const std::exception& e) {
        LOGE("%s", e.what());
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
    return 0;
}
