#include <gtest/gtest.h>

#include <string>

#include "coregrid.hpp"
#include "json_parser.hpp"
#include "report_writer.hpp"

namespace {

Cell makeCell(CellType type, int gridX, int gridY, int rawX, int rawY) {
    Cell cell;
    cell.type = type;
    cell.gridX = gridX;
    cell.gridY = gridY;
    cell.originalGridX = rawX;
    cell.originalGridY = rawY;
    cell.pixelCenter = cv::Point2d(rawX * 26 + 12.5, rawY * 26 + 13.9);
    cell.area = 100;
    return cell;
}

ScanReport sampleReport() {
    ScanReport report;
    report.imageSize = cv::Size(260, 182);
    report.cellSize = 26;
    report.cells[AZ].push_back(makeCell(AZ, 0, 0, 0, 0));
    report.cells[TK].push_back(makeCell(TK, 2, 1, 3, 1));
    report.cells[TK].push_back(makeCell(TK, 1, 1, 1, 1));
    report.cells[TK].push_back(makeCell(TK, 0, 2, 0, 3));
    report.totalCells = 4;
    report.gridSize = cv::Size(3, 3);
    return report;
}

}  // namespace

TEST(ReportWriterTest, JsonCarriesMetadataAndAllTypes) {
    std::string json = formatReportJson(sampleReport());

    EXPECT_NE(json.find("\"cell_size\": 26"), std::string::npos);
    EXPECT_NE(json.find("\"total_cells\": 4"), std::string::npos);
    for (const char* type : {"AZ", "TK", "RR", "AR", "LAR", "USP"}) {
        EXPECT_NE(json.find(std::string("\"") + type + "\":"), std::string::npos) << type;
    }
    EXPECT_NE(json.find("\"RR\": []"), std::string::npos);
    EXPECT_NE(json.find("\"original_grid_x\": 3"), std::string::npos);
    EXPECT_NE(json.find("\"pixel_x\": 90"), std::string::npos);  // 3 * 26 + 12.5 truncated
    EXPECT_NE(json.find("\"pixel_y\": 39"), std::string::npos);  // 1 * 26 + 13.9 truncated
    EXPECT_LT(json.find("\"metadata\":"), json.find("\"cells\":"));
    EXPECT_LT(json.find("\"cells\":"), json.find("\"positions_by_type\":"));
}

TEST(ReportWriterTest, JsonReadsBack) {
    std::string json = formatReportJson(sampleReport());

    ReportMetadata metadata = parseReportMetadata(json);
    ASSERT_TRUE(metadata.success);
    EXPECT_EQ(metadata.imageSize, cv::Size(260, 182));
    EXPECT_EQ(metadata.cellSize, 26);
    EXPECT_EQ(metadata.totalCells, 4);
    EXPECT_EQ(metadata.gridSize, cv::Size(3, 3));

    PositionLists positions = parsePositionsByType(json);
    EXPECT_EQ(positions[AZ], std::vector<std::string>({"0,0"}));
    EXPECT_EQ(positions[TK], std::vector<std::string>({"2,1", "1,1", "0,2"}));
    EXPECT_TRUE(positions[RR].empty());
    EXPECT_TRUE(positions[USP].empty());
}

TEST(ReportWriterTest, ParserReportsMissingSections) {
    EXPECT_FALSE(parseReportMetadata("{\"cells\": {}}").success);
    PositionLists positions = parsePositionsByType("{}");
    for (const auto& list : positions) {
        EXPECT_TRUE(list.empty());
    }
}

TEST(ReportWriterTest, TypeScriptGroupsRowsAndSkipsEmptyTypes) {
    ScanReport report = sampleReport();
    // Same position twice in one row is listed once.
    report.cells[TK].push_back(makeCell(TK, 1, 1, 1, 1));

    std::string ts = formatTypeScript(report.cells);

    const std::string expectedTk =
        "// TK positions - 4 cells\n"
        "const tkPositions = new Set<string>([\n"
        "    // Row 1\n"
        "    '1,1', '2,1',\n"
        "    // Row 2\n"
        "    '0,2',\n"
        "]);\n";
    EXPECT_NE(ts.find(expectedTk), std::string::npos) << ts;
    EXPECT_NE(ts.find("const azPositions = new Set<string>([\n    // Row 0\n    '0,0',\n]);"),
              std::string::npos);
    EXPECT_EQ(ts.find("rrPositions"), std::string::npos);
    EXPECT_EQ(ts.find("usp"), std::string::npos);
    EXPECT_EQ(ts.rfind("// Auto-generated", 0), 0u);
}

TEST(ReportWriterTest, OutputEndings) {
    ScanReport report = sampleReport();

    std::string json = formatReportJson(report);
    ASSERT_FALSE(json.empty());
    EXPECT_EQ(json.back(), '}');

    std::string ts = formatTypeScript(report.cells);
    ASSERT_GE(ts.size(), 4u);
    EXPECT_EQ(ts.substr(ts.size() - 4), "]);\n");
    EXPECT_NE(ts.substr(ts.size() - 5), "]);\n\n");

    // Blocks are separated by one blank line.
    EXPECT_NE(ts.find("]);\n\n// TK positions"), std::string::npos);

    CellMap empty;
    EXPECT_EQ(formatTypeScript(empty),
              "// Auto-generated from OPB-82 scheme image\n"
              "// Cell positions extracted by coregrid\n"
              "// Coordinates are normalized to a continuous grid (grid lines removed)\n");
}

TEST(ReportWriterTest, OutputPathsFollowInput) {
    EXPECT_EQ(defaultReportPath("/data/opb82_scheme.png"), "/data/opb82_scheme.json");
    EXPECT_EQ(typeScriptPathFor("/data/opb82_scheme.json"), "/data/opb82_scheme.ts");
    EXPECT_EQ(typeScriptPathFor("out/cells"), "out/cells.ts");
}
