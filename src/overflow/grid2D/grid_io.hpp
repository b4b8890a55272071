#pragma once

#include <iosfwd>
#include <string>

#include "grid.hpp"

// Plain text grids: one row per line, values separated by whitespace or
// commas. Blank lines are skipped.
CellMatrix readGrid(std::istream& in);
CellMatrix loadGrid(const std::string& path);

void writeGrid(std::ostream& out, const CellMatrix& cells);
void saveGrid(const CellMatrix& cells, const std::string& path);
