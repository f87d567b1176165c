#include "json_parser.hpp"
#include "utilities.hpp"

namespace {

// Integer value following "key": at or after pos; npos-safe.
bool findIntField(const std::string& jsonStr, const std::string& key, size_t pos, int& value) {
    size_t keyPos = jsonStr.find("\"" + key + "\":", pos);
    if (keyPos == std::string::npos) {
        return false;
    }
    try {
        value = std::stoi(jsonStr.substr(keyPos + key.length() + 3));
    } catch (const std::exception& e) {
        LOGE("Bad value for %s: %s", key.c_str(), e.what());
        return false;
    }
    return true;
}

bool findSizeField(const std::string& jsonStr, const std::string& key, size_t pos,
                   cv::Size& size) {
    size_t keyPos = jsonStr.find("\"" + key + "\":", pos);
    if (keyPos == std::string::npos) {
        return false;
    }
    size_t objEnd = jsonStr.find("}", keyPos);
    std::string sizeObj = jsonStr.substr(keyPos, objEnd - keyPos + 1);
    return findIntField(sizeObj, "width", 0, size.width) &&
           findIntField(sizeObj, "height", 0, size.height);
}

}  // namespace

ReportMetadata parseReportMetadata(const std::string& jsonStr) {
    ReportMetadata result;
    result.cellSize = 0;
    result.totalCells = 0;
    result.success = false;

    size_t metaStart = jsonStr.find("\"metadata\":");
    if (metaStart == std::string::npos) {
        return result;
    }

    result.success = findSizeField(jsonStr, "image_size", metaStart, result.imageSize) &&
                     findIntField(jsonStr, "cell_size", metaStart, result.cellSize) &&
                     findIntField(jsonStr, "total_cells", metaStart, result.totalCells) &&
                     findSizeField(jsonStr, "grid_size", metaStart, result.gridSize);
    LOGI("Parsed metadata: %dx%d image, %d cells, %dx%d grid", result.imageSize.width,
         result.imageSize.height, result.totalCells, result.gridSize.width,
         result.gridSize.height);
    return result;
}

PositionLists parsePositionsByType(const std::string& jsonStr) {
    PositionLists positions;
    size_t sectionStart = jsonStr.find("\"positions_by_type\":");
    if (sectionStart == std::string::npos) {
        return positions;
    }

    for (int t = 0; t < CELL_TYPE_COUNT; ++t) {
        std::string key = "\"" + cellTypeName(static_cast<CellType>(t)) + "\":";
        size_t keyPos = jsonStr.find(key, sectionStart);
        if (keyPos == std::string::npos) continue;

        size_t arrayStart = jsonStr.find("[", keyPos);
        size_t arrayEnd = jsonStr.find("]", arrayStart);
        if (arrayStart == std::string::npos || arrayEnd == std::string::npos) continue;

        size_t pos = arrayStart + 1;
        while (pos < arrayEnd) {
            size_t strStart = jsonStr.find("\"", pos);
            if (strStart == std::string::npos || strStart >= arrayEnd) break;

            size_t strEnd = jsonStr.find("\"", strStart + 1);
            if (strEnd == std::string::npos) break;

            positions[t].push_back(jsonStr.substr(strStart + 1, strEnd - strStart - 1));
            pos = strEnd + 1;
        }
    }
    return positions;
}
