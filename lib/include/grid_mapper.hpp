#ifndef GRID_MAPPER_HPP
#define GRID_MAPPER_HPP

#include <array>
#include <map>
#include <opencv2/opencv.hpp>
#include <vector>

#include "color_matcher.hpp"

struct Cell {
    CellType type;
    int gridX;
    int gridY;
    int originalGridX;  // raw quantized coordinate before gap removal
    int originalGridY;
    cv::Point2d pixelCenter;
    int area;
};

// One cell list per CellType, indexed by the enumeration.
typedef std::array<std::vector<Cell>, CELL_TYPE_COUNT> CellMap;

/**
 * Map a pixel-space centroid to its grid cell by truncating centroid / cellSize.
 */
cv::Point quantize(const cv::Point2d& centroid, int cellSize);

/**
 * Dense, order-preserving index over the distinct coordinate values occupied on one axis.
 */
class GridIndex {
   public:
    GridIndex() = default;

    static GridIndex build(const std::vector<int>& values);

    /**
     * Rank of an occupied value. Throws std::out_of_range for values that were not indexed.
     */
    int rankOf(int value) const;

    /**
     * Occupied value at a rank. Throws std::out_of_range for ranks outside [0, size()).
     */
    int valueAt(int rank) const;

    bool contains(int value) const { return ranks.count(value) > 0; }
    int size() const { return static_cast<int>(values.size()); }
    bool empty() const { return values.empty(); }
    const std::vector<int>& sortedValues() const { return values; }

   private:
    std::vector<int> values;
    std::map<int, int> ranks;
};

struct NormalizationResult {
    CellMap cells;
    GridIndex xIndex;
    GridIndex yIndex;
};

/**
 * Remove the empty rows and columns left by grid lines. Every cell's grid coordinate is replaced
 * by the rank of its raw value among all occupied values on that axis (across every type). The
 * raw values move to originalGridX / originalGridY; the input map is left untouched.
 */
NormalizationResult normalizeCoordinates(const CellMap& cells);

/**
 * Extent of the normalized grid: max - min + 1 on each axis, or 0x0 when there are no cells.
 */
cv::Size gridExtent(const CellMap& cells);

int totalCellCount(const CellMap& cells);

#endif  // GRID_MAPPER_HPP
