#include "grid_mapper.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "utilities.hpp"

cv::Point quantize(const cv::Point2d& centroid, int cellSize) {
    return cv::Point(static_cast<int>(centroid.x / cellSize),
                     static_cast<int>(centroid.y / cellSize));
}

GridIndex GridIndex::build(const std::vector<int>& values) {
    GridIndex index;
    index.values = values;
    std::sort(index.values.begin(), index.values.end());
    index.values.erase(std::unique(index.values.begin(), index.values.end()), index.values.end());
    for (size_t i = 0; i < index.values.size(); ++i) {
        index.ranks[index.values[i]] = static_cast<int>(i);
    }
    return index;
}

int GridIndex::rankOf(int value) const {
    auto it = ranks.find(value);
    if (it == ranks.end()) {
        throw std::out_of_range("Coordinate " + std::to_string(value) + " is not occupied");
    }
    return it->second;
}

int GridIndex::valueAt(int rank) const {
    if (rank < 0 || rank >= size()) {
        throw std::out_of_range("Rank " + std::to_string(rank) + " outside grid of " +
                                std::to_string(size()));
    }
    return values[rank];
}

NormalizationResult normalizeCoordinates(const CellMap& cells) {
    std::vector<int> allX;
    std::vector<int> allY;
    for (const auto& cellList : cells) {
        for (const auto& cell : cellList) {
            allX.push_back(cell.gridX);
            allY.push_back(cell.gridY);
        }
    }

    NormalizationResult result;
    result.xIndex = GridIndex::build(allX);
    result.yIndex = GridIndex::build(allY);

    for (int t = 0; t < CELL_TYPE_COUNT; ++t) {
        result.cells[t].reserve(cells[t].size());
        for (const auto& cell : cells[t]) {
            Cell normalized = cell;
            normalized.gridX = result.xIndex.rankOf(cell.gridX);
            normalized.gridY = result.yIndex.rankOf(cell.gridY);
            normalized.originalGridX = cell.gridX;
            normalized.originalGridY = cell.gridY;
            result.cells[t].push_back(normalized);
        }
    }

    LOGI("[normalizeCoordinates] %d distinct X, %d distinct Y", result.xIndex.size(),
         result.yIndex.size());
    return result;
}

cv::Size gridExtent(const CellMap& cells) {
    bool any = false;
    int minX = 0, maxX = 0, minY = 0, maxY = 0;
    for (const auto& cellList : cells) {
        for (const auto& cell : cellList) {
            if (!any) {
                minX = maxX = cell.gridX;
                minY = maxY = cell.gridY;
                any = true;
                continue;
            }
            minX = std::min(minX, cell.gridX);
            maxX = std::max(maxX, cell.gridX);
            minY = std::min(minY, cell.gridY);
            maxY = std::max(maxY, cell.gridY);
        }
    }
    if (!any) {
        return cv::Size(0, 0);
    }
    return cv::Size(maxX - minX + 1, maxY - minY + 1);
}

int totalCellCount(const CellMap& cells) {
    size_t total = 0;
    for (const auto& cellList : cells) {
        total += cellList.size();
    }
    return static_cast<int>(total);
}
