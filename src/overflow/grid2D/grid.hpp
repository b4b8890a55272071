#pragma once

#include <Eigen/Core>

#include <vector>
#include <random>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// ---- Cells ---- //
// row-major so raw() matches the nested-row layout callers hand in
using CellMatrix =
    Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// a cell at or above this value overflows
constexpr int THRESHOLD = 4;

// ---- Errors ---- //
class InvalidGrid : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidRoundCount : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---- Traversal ---- //
// Order in which a round visits cells. Every order yields the same grid.
enum class Traversal : uint8_t {
    ROW_MAJOR    = 0,
    COLUMN_MAJOR = 1,
    SHUFFLED     = 2,
    PARALLEL     = 3
};

Traversal parseTraversal(const std::string& name);
int parseRounds(const std::string& text);
const char* traversalName(Traversal t) noexcept;

// ---- Parameters ---- //
struct Parameters {
    int threshold{THRESHOLD};
    int rounds{0};
    Traversal traversal{Traversal::ROW_MAJOR};
    unsigned int seed{0};   // SHUFFLED only; 0 draws from std::random_device
};

void validate(const Parameters& params);

// ---- Conversion ---- //
CellMatrix toMatrix(const std::vector<std::vector<int>>& rows);
std::vector<std::vector<int>> toRows(const CellMatrix& cells);

// ---- Round ---- //
// Scatter pass over the snapshot. Each active cell gives one unit to every
// in-bounds neighbour (up, left, right, down) and loses one per transfer.
CellMatrix computeDeltas(const CellMatrix& snapshot, int threshold = THRESHOLD);
CellMatrix computeDeltas(const CellMatrix& snapshot, int threshold,
                         const std::vector<std::size_t>& order);

// Gather form of the same pass: one write per cell.
CellMatrix computeDeltasParallel(const CellMatrix& snapshot,
                                 int threshold = THRESHOLD);

void applyDeltas(CellMatrix& cells, const CellMatrix& delta);

std::vector<std::size_t> cellOrder(std::size_t rows, std::size_t cols,
                                   Traversal traversal, std::mt19937& rng);

void step(CellMatrix& cells, const Parameters& params, std::mt19937& rng);

// ---- Simulate ---- //
CellMatrix simulate(const CellMatrix& cells, int rounds);
CellMatrix simulate(const CellMatrix& cells, const Parameters& params);
std::vector<std::vector<int>> simulate(
    const std::vector<std::vector<int>>& rows, int rounds);

// ---- Queries ---- //
long long total(const CellMatrix& cells);
std::size_t countActive(const CellMatrix& cells, int threshold = THRESHOLD);
bool isStable(const CellMatrix& cells, int threshold = THRESHOLD);

// ---- Grid ---- //
class Grid {
private:
    CellMatrix data;

    std::mt19937 rng;

    Parameters params;
    int rounds_run{0};

public:
    Grid(const std::vector<std::vector<int>>& initial,
         const Parameters& params);
    Grid(const CellMatrix& initial, const Parameters& params);

    void step();
    void simulate();
    void simulate(int rounds);

    // ---- Accessors ---- //
    std::size_t getRows() const noexcept { return static_cast<std::size_t>(data.rows()); }
    std::size_t getCols() const noexcept { return static_cast<std::size_t>(data.cols()); }
    int roundsRun() const noexcept { return rounds_run; }

    // throws std::out_of_range outside the grid
    int at(std::size_t i, std::size_t j) const;
    long long total() const { return ::total(data); }
    bool isStable() const { return ::isStable(data, params.threshold); }

    const Parameters& parameters() const noexcept { return params; }
    const CellMatrix& cells() const noexcept { return data; }
    const int* raw() const noexcept { return data.data(); }
};
