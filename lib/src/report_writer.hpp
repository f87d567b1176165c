#pragma once

#include <string>

#include "coregrid.hpp"

std::string formatReportJson(const ScanReport& report);
std::string formatTypeScript(const CellMap& cells);
