#include "report_writer.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <vector>

namespace {

std::string indent(int level) { return std::string(level * 2, ' '); }

std::string positionKey(const Cell& cell) {
    return std::to_string(cell.gridX) + "," + std::to_string(cell.gridY);
}

std::string formatSizeJson(const cv::Size& size, int level) {
    std::string json = "{\n";
    json += indent(level + 1) + "\"width\": " + std::to_string(size.width) + ",\n";
    json += indent(level + 1) + "\"height\": " + std::to_string(size.height) + "\n";
    json += indent(level) + "}";
    return json;
}

std::string formatCellJson(const Cell& cell, int level) {
    std::string json = indent(level) + "{\n";
    json += indent(level + 1) + "\"grid_x\": " + std::to_string(cell.gridX) + ",\n";
    json += indent(level + 1) + "\"grid_y\": " + std::to_string(cell.gridY) + ",\n";
    json += indent(level + 1) + "\"original_grid_x\": " + std::to_string(cell.originalGridX) + ",\n";
    json += indent(level + 1) + "\"original_grid_y\": " + std::to_string(cell.originalGridY) + ",\n";
    json += indent(level + 1) + "\"pixel_x\": " +
            std::to_string(static_cast<int>(cell.pixelCenter.x)) + ",\n";
    json += indent(level + 1) + "\"pixel_y\": " +
            std::to_string(static_cast<int>(cell.pixelCenter.y)) + ",\n";
    json += indent(level + 1) + "\"area\": " + std::to_string(cell.area) + "\n";
    json += indent(level) + "}";
    return json;
}

// Emits "<TYPE>": [ ... ] for every type, one element per cell.
template <typename Formatter>
std::string formatPerTypeJson(const CellMap& cells, int level, Formatter formatElement) {
    std::string json = "{\n";
    for (int t = 0; t < CELL_TYPE_COUNT; ++t) {
        const auto& cellList = cells[t];
        json += indent(level + 1) + "\"" + cellTypeName(static_cast<CellType>(t)) + "\": ";
        if (cellList.empty()) {
            json += "[]";
        } else {
            json += "[\n";
            for (size_t i = 0; i < cellList.size(); ++i) {
                json += formatElement(cellList[i], level + 2);
                if (i < cellList.size() - 1) json += ",";
                json += "\n";
            }
            json += indent(level + 1) + "]";
        }
        if (t < CELL_TYPE_COUNT - 1) json += ",";
        json += "\n";
    }
    json += indent(level) + "}";
    return json;
}

}  // namespace

std::string formatReportJson(const ScanReport& report) {
    std::string json = "{\n";

    json += indent(1) + "\"metadata\": {\n";
    json += indent(2) + "\"image_size\": " + formatSizeJson(report.imageSize, 2) + ",\n";
    json += indent(2) + "\"cell_size\": " + std::to_string(report.cellSize) + ",\n";
    json += indent(2) + "\"total_cells\": " + std::to_string(report.totalCells) + ",\n";
    json += indent(2) + "\"grid_size\": " + formatSizeJson(report.gridSize, 2) + "\n";
    json += indent(1) + "},\n";

    json += indent(1) + "\"cells\": " + formatPerTypeJson(report.cells, 1, formatCellJson) + ",\n";

    json += indent(1) + "\"positions_by_type\": " +
            formatPerTypeJson(report.cells, 1, [](const Cell& cell, int level) {
                return indent(level) + "\"" + positionKey(cell) + "\"";
            }) +
            "\n";

    json += "}";
    return json;
}

std::string formatTypeScript(const CellMap& cells) {
    std::vector<std::string> lines = {
        "// Auto-generated from OPB-82 scheme image",
        "// Cell positions extracted by coregrid",
        "// Coordinates are normalized to a continuous grid (grid lines removed)",
        "",
    };

    for (int t = 0; t < CELL_TYPE_COUNT; ++t) {
        const auto& cellList = cells[t];
        if (cellList.empty()) {
            continue;
        }

        std::string name = cellTypeName(static_cast<CellType>(t));
        std::string lowerName = name;
        std::transform(lowerName.begin(), lowerName.end(), lowerName.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        lines.push_back("// " + name + " positions - " + std::to_string(cellList.size()) +
                        " cells");
        lines.push_back("const " + lowerName + "Positions = new Set<string>([");

        // Row grouping is only for readability of the generated file.
        std::map<int, std::set<int>> byRow;
        for (const auto& cell : cellList) {
            byRow[cell.gridY].insert(cell.gridX);
        }

        for (const auto& row : byRow) {
            std::string entries;
            for (int col : row.second) {
                if (!entries.empty()) entries += ", ";
                entries += "'" + std::to_string(col) + "," + std::to_string(row.first) + "'";
            }
            lines.push_back("    // Row " + std::to_string(row.first));
            lines.push_back("    " + entries + ",");
        }

        lines.push_back("]);");
        lines.push_back("");
    }

    // Lines are joined, not terminated: the file ends right after the last "]);\n".
    std::string ts;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) ts += "\n";
        ts += lines[i];
    }
    return ts;
}
