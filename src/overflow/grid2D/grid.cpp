#include "grid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

// up, left, right, down
static const int DI[4] = {-1, 0, 0, 1};
static const int DJ[4] = { 0,-1, 1, 0};

static inline bool inBounds(const CellMatrix& m, Eigen::Index i, Eigen::Index j)
{
    return i >= 0 && j >= 0 && i < m.rows() && j < m.cols();
}

static void scatterCell(const CellMatrix& snapshot, CellMatrix& delta,
                        Eigen::Index i, Eigen::Index j, int threshold)
{
    if (snapshot(i, j) < threshold) return;

    for (int d = 0; d < 4; ++d)
    {
        const Eigen::Index ni = i + DI[d];
        const Eigen::Index nj = j + DJ[d];
        if (!inBounds(snapshot, ni, nj)) continue;

        delta(ni, nj) += 1;
        delta(i, j)   -= 1;
    }
}

// ---- Traversal ---- //
Traversal parseTraversal(const std::string& name)
{
    if (name == "row" || name == "row_major")       return Traversal::ROW_MAJOR;
    if (name == "column" || name == "column_major") return Traversal::COLUMN_MAJOR;
    if (name == "shuffled")                         return Traversal::SHUFFLED;
    if (name == "parallel")                         return Traversal::PARALLEL;
    throw std::invalid_argument("Unknown traversal: " + name);
}

int parseRounds(const std::string& text)
{
    std::size_t used = 0;
    int rounds = 0;
    try
    {
        rounds = std::stoi(text, &used);
    }
    catch (const std::logic_error&)
    {
        used = 0;
    }

    if (text.empty() || used != text.size())
        throw InvalidRoundCount("rounds is not an integer: '" + text + "'");
    if (rounds < 0)
        throw InvalidRoundCount("rounds must be non-negative, got " + text);
    return rounds;
}

const char* traversalName(Traversal t) noexcept
{
    switch (t)
    {
        case Traversal::ROW_MAJOR:    return "row_major";
        case Traversal::COLUMN_MAJOR: return "column_major";
        case Traversal::SHUFFLED:     return "shuffled";
        case Traversal::PARALLEL:     return "parallel";
    }
    return "unknown";
}

void validate(const Parameters& params)
{
    if (params.threshold < 1)
        throw std::invalid_argument("threshold must be positive");
    if (params.rounds < 0)
        throw InvalidRoundCount("rounds must be non-negative, got " +
                                std::to_string(params.rounds));
}

// ---- Conversion ---- //
CellMatrix toMatrix(const std::vector<std::vector<int>>& rows)
{
    const std::size_t n_rows = rows.size();
    const std::size_t n_cols = rows.empty() ? 0 : rows[0].size();

    if (n_rows == 0 || n_cols == 0)
        throw InvalidGrid("Grid must be non-empty");

    for (const auto& row : rows)
        if (row.size() != n_cols)
            throw InvalidGrid("Grid must be rectangular");

    CellMatrix cells(n_rows, n_cols);
    for (std::size_t i = 0; i < n_rows; ++i)
        for (std::size_t j = 0; j < n_cols; ++j)
            cells(i, j) = rows[i][j];

    return cells;
}

std::vector<std::vector<int>> toRows(const CellMatrix& cells)
{
    std::vector<std::vector<int>> rows(cells.rows());
    for (Eigen::Index i = 0; i < cells.rows(); ++i)
        rows[i].assign(cells.row(i).data(), cells.row(i).data() + cells.cols());
    return rows;
}

// ---- Round ---- //
CellMatrix computeDeltas(const CellMatrix& snapshot, int threshold)
{
    CellMatrix delta = CellMatrix::Zero(snapshot.rows(), snapshot.cols());

    for (Eigen::Index i = 0; i < snapshot.rows(); ++i)
        for (Eigen::Index j = 0; j < snapshot.cols(); ++j)
            scatterCell(snapshot, delta, i, j, threshold);

    return delta;
}

CellMatrix computeDeltas(const CellMatrix& snapshot, int threshold,
                         const std::vector<std::size_t>& order)
{
    const std::size_t cols = static_cast<std::size_t>(snapshot.cols());
    const std::size_t size = static_cast<std::size_t>(snapshot.size());

    CellMatrix delta = CellMatrix::Zero(snapshot.rows(), snapshot.cols());

    for (std::size_t k : order)
    {
        if (k >= size)
            throw std::out_of_range("cell index " + std::to_string(k) +
                                    " outside grid of " + std::to_string(size));
        scatterCell(snapshot, delta, k / cols, k % cols, threshold);
    }

    return delta;
}

CellMatrix computeDeltasParallel(const CellMatrix& snapshot, int threshold)
{
    const Eigen::Index rows = snapshot.rows();
    const Eigen::Index cols = snapshot.cols();

    CellMatrix delta(rows, cols);

    #pragma omp parallel for if(rows * cols > 4096)
    for (Eigen::Index i = 0; i < rows; ++i)
    {
        for (Eigen::Index j = 0; j < cols; ++j)
        {
            const bool active = snapshot(i, j) >= threshold;
            int d_ij = 0;

            for (int d = 0; d < 4; ++d)
            {
                const Eigen::Index ni = i + DI[d];
                const Eigen::Index nj = j + DJ[d];
                if (!inBounds(snapshot, ni, nj)) continue;

                // inflow from an active neighbour, outflow if this cell is active
                if (snapshot(ni, nj) >= threshold) ++d_ij;
                if (active) --d_ij;
            }

            delta(i, j) = d_ij;
        }
    }

    return delta;
}

void applyDeltas(CellMatrix& cells, const CellMatrix& delta)
{
    if (cells.rows() != delta.rows() || cells.cols() != delta.cols())
        throw InvalidGrid("Delta grid shape does not match grid");

    cells += delta;
}

std::vector<std::size_t> cellOrder(std::size_t rows, std::size_t cols,
                                   Traversal traversal, std::mt19937& rng)
{
    std::vector<std::size_t> order(rows * cols);

    if (traversal == Traversal::COLUMN_MAJOR)
    {
        std::size_t k = 0;
        for (std::size_t j = 0; j < cols; ++j)
            for (std::size_t i = 0; i < rows; ++i)
                order[k++] = i * cols + j;
        return order;
    }

    std::iota(order.begin(), order.end(), std::size_t{0});
    if (traversal == Traversal::SHUFFLED)
        std::shuffle(order.begin(), order.end(), rng);

    return order;
}

void step(CellMatrix& cells, const Parameters& params, std::mt19937& rng)
{
    CellMatrix delta;

    switch (params.traversal)
    {
        case Traversal::ROW_MAJOR:
            delta = computeDeltas(cells, params.threshold);
            break;
        case Traversal::PARALLEL:
            delta = computeDeltasParallel(cells, params.threshold);
            break;
        default:
            delta = computeDeltas(
                cells, params.threshold,
                cellOrder(cells.rows(), cells.cols(), params.traversal, rng));
            break;
    }

    // commit only after every cell has been read
    applyDeltas(cells, delta);
}

static std::mt19937 seededRng(unsigned int seed)
{
    std::mt19937 rng;
    if (seed != 0)
    {
        rng.seed(seed);
    }
    else
    {
        std::random_device rd;
        rng.seed(rd());
    }
    return rng;
}

// ---- Simulate ---- //
CellMatrix simulate(const CellMatrix& cells, int rounds)
{
    Parameters params;
    params.rounds = rounds;
    return simulate(cells, params);
}

CellMatrix simulate(const CellMatrix& cells, const Parameters& params)
{
    validate(params);
    if (cells.size() == 0)
        throw InvalidGrid("Grid must be non-empty");

    CellMatrix out = cells;
    if (params.rounds == 0) return out;

    spdlog::debug("simulate: {} rounds on {}x{} grid ({}, threshold {})",
                  params.rounds, cells.rows(), cells.cols(),
                  traversalName(params.traversal), params.threshold);

    std::mt19937 rng = seededRng(params.seed);
    for (int t = 0; t < params.rounds; ++t)
        step(out, params, rng);

    return out;
}

std::vector<std::vector<int>> simulate(
    const std::vector<std::vector<int>>& rows, int rounds)
{
    return toRows(simulate(toMatrix(rows), rounds));
}

// ---- Queries ---- //
long long total(const CellMatrix& cells)
{
    return cells.cast<long long>().sum();
}

std::size_t countActive(const CellMatrix& cells, int threshold)
{
    return static_cast<std::size_t>((cells.array() >= threshold).count());
}

bool isStable(const CellMatrix& cells, int threshold)
{
    return countActive(cells, threshold) == 0;
}

// ---- Grid ---- //
Grid::Grid(const std::vector<std::vector<int>>& initial,
           const Parameters& p)
    : Grid(toMatrix(initial), p)
{
}

Grid::Grid(const CellMatrix& initial, const Parameters& p)
    : data(initial),
      rng(seededRng(p.seed)),
      params(p)
{
    if (data.size() == 0)
        throw InvalidGrid("Grid must be non-empty");

    validate(params);
}

int Grid::at(std::size_t i, std::size_t j) const
{
    if (i >= getRows() || j >= getCols())
        throw std::out_of_range("cell (" + std::to_string(i) + ", " +
                                std::to_string(j) + ") outside " +
                                std::to_string(getRows()) + "x" +
                                std::to_string(getCols()) + " grid");
    return data(i, j);
}

void Grid::step()
{
    ::step(data, params, rng);
    ++rounds_run;
}

void Grid::simulate()
{
    simulate(params.rounds);
}

void Grid::simulate(int rounds)
{
    if (rounds < 0)
        throw InvalidRoundCount("rounds must be non-negative, got " +
                                std::to_string(rounds));

    spdlog::debug("Grid::simulate: {} rounds on {}x{} grid",
                  rounds, getRows(), getCols());

    for (int t = 0; t < rounds; ++t)
        step();
}
