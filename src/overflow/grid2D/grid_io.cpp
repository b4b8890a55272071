#include "grid_io.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <vector>

CellMatrix readGrid(std::istream& in)
{
    std::vector<std::vector<int>> rows;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line))
    {
        ++line_no;
        std::replace(line.begin(), line.end(), ',', ' ');

        std::vector<int> row;
        std::istringstream iss(line);
        std::string token;

        while (iss >> token)
        {
            std::size_t used = 0;
            int value = 0;
            try
            {
                value = std::stoi(token, &used);
            }
            catch (const std::logic_error&)
            {
                used = 0;
            }

            if (used != token.size())
                throw InvalidGrid("line " + std::to_string(line_no) +
                                  ": not an integer: '" + token + "'");
            row.push_back(value);
        }

        if (!row.empty())
            rows.push_back(row);
    }

    // toMatrix rejects empty and jagged input
    return toMatrix(rows);
}

CellMatrix loadGrid(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot open grid file: " + path);

    CellMatrix cells = readGrid(file);
    spdlog::debug("Loaded grid: {} x {} from {}", cells.rows(), cells.cols(), path);
    return cells;
}

void writeGrid(std::ostream& out, const CellMatrix& cells)
{
    for (Eigen::Index i = 0; i < cells.rows(); ++i)
    {
        for (Eigen::Index j = 0; j < cells.cols(); ++j)
        {
            out << cells(i, j);
            if (j < cells.cols() - 1)
                out << " ";
        }
        out << "\n";
    }
}

void saveGrid(const CellMatrix& cells, const std::string& path)
{
    std::ofstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot open output file: " + path);

    writeGrid(file, cells);
    if (!file)
        throw std::runtime_error("Failed writing grid to: " + path);
}
