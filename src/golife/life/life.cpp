#include "life.hpp"
#include <cmath>
#include <sstream>
#include <algorithm>

namespace {

inline int wrap(int value, int modulo) {
    value %= modulo;
    if (value < 0) value += modulo;
    return value;
}

std::string describe(int x, int y, int cols, int rows) {
    std::ostringstream os;
    os << "cell (" << x << ", " << y << ") outside "
       << cols << " x " << rows << " grid";
    return os.str();
}

void checkParameters(const LifeParameters& p) {
    if (p.edge != EDGE_TORUS && p.edge != EDGE_DEAD)
        throw std::invalid_argument("Unknown edge policy");
    if (!std::isfinite(p.fill) || p.fill < 0.0 || p.fill > 1.0)
        throw std::invalid_argument("fill must be within [0, 1]");
}

} // namespace

void Life::allocate(int cols, int rows)
{
    if (cols <= 0 || rows <= 0) {
        std::ostringstream os;
        os << "Grid dimensions must be positive, got "
           << cols << " x " << rows;
        throw InvalidDimensions(os.str());
    }

    nCols = cols;
    nRows = rows;
    data.assign(static_cast<std::size_t>(cols) * rows, CELL_DEAD);
    next.assign(data.size(), CELL_DEAD);
}

void Life::seed(std::mt19937& rng)
{
    std::uniform_int_distribution<int> col(0, nCols - 1);
    std::uniform_int_distribution<int> row(0, nRows - 1);

    const long placements =
        static_cast<long>(std::floor(double(nCols) * nRows * params.fill));
    for (long k = 0; k < placements; ++k) {
        const int x = col(rng);
        const int y = row(rng);
        data[idx(x, y)] = CELL_ALIVE;
    }
}

Life::Life(int cols, int rows, const LifeParameters& p)
    : params(p)
{
    checkParameters(params);
    allocate(cols, rows);

    std::random_device rd;
    std::mt19937 rng(rd());
    seed(rng);
}

Life::Life(int cols, int rows, uint32_t s, const LifeParameters& p)
    : params(p)
{
    checkParameters(params);
    allocate(cols, rows);

    std::mt19937 rng(s);
    seed(rng);
}

Life::Life(const std::vector<std::vector<int>>& pattern,
           const LifeParameters& p)
    : params(p)
{
    checkParameters(params);
    allocate(pattern.empty() ? 0 : static_cast<int>(pattern[0].size()),
             static_cast<int>(pattern.size()));

    for (const auto& row : pattern)
        if (row.size() != static_cast<std::size_t>(nCols))
            throw std::invalid_argument("Pattern must be rectangular");

    for (int y = 0; y < nRows; ++y)
        for (int x = 0; x < nCols; ++x) {
            const int v = pattern[y][x];
            if (v != CELL_DEAD && v != CELL_ALIVE)
                throw std::invalid_argument("Pattern values must be 0 or 1");
            data[idx(x, y)] = static_cast<uint8_t>(v);
        }
}

Life::Life(const Pattern& pattern, const LifeParameters& p)
    : params(p)
{
    checkParameters(params);
    allocate(static_cast<int>(pattern.cols()),
             static_cast<int>(pattern.rows()));

    for (int y = 0; y < nRows; ++y)
        for (int x = 0; x < nCols; ++x) {
            const uint8_t v = pattern(y, x);
            if (v != CELL_DEAD && v != CELL_ALIVE)
                throw std::invalid_argument("Pattern values must be 0 or 1");
            data[idx(x, y)] = v;
        }
}

int Life::countNeighbors(int x, int y) const
{
    int count = 0;
    for (int dy = -1; dy <= 1; ++dy)
    for (int dx = -1; dx <= 1; ++dx)
    {
        if (dx == 0 && dy == 0) continue;

        int nx = x + dx;
        int ny = y + dy;

        if (params.edge == EDGE_TORUS) {
            nx = wrap(nx, nCols);
            ny = wrap(ny, nRows);
        } else if (nx < 0 || ny < 0 || nx >= nCols || ny >= nRows) {
            continue;
        }

        count += data[idx(nx, ny)];
    }
    return count;
}

void Life::step()
{
    for (int y = 0; y < nRows; ++y)
    {
        for (int x = 0; x < nCols; ++x)
        {
            const int n = countNeighbors(x, y);
            const std::size_t k = idx(x, y);

            // B3/S23
            if (n == 3 || (n == 2 && data[k] == CELL_ALIVE))
                next[k] = CELL_ALIVE;
            else
                next[k] = CELL_DEAD;
        }
    }

    data.swap(next);
    ++gen;
}

void Life::step(int n)
{
    if (n < 0)
        throw std::invalid_argument("Step count must be non-negative");

    for (int t = 0; t < n; ++t)
        step();
}

void Life::restore(const Pattern& pattern)
{
    if (pattern.rows() != nRows || pattern.cols() != nCols)
        throw InvalidDimensions("Pattern shape does not match grid");

    // Existing buffers are reused so outstanding views of raw() stay valid.
    std::copy(pattern.data(), pattern.data() + pattern.size(), data.begin());
    std::fill(next.begin(), next.end(), CELL_DEAD);
    gen = 0;
}

bool Life::alive(int x, int y) const
{
    if (x < 0 || y < 0 || x >= nCols || y >= nRows)
        throw OutOfBounds(describe(x, y, nCols, nRows));

    return data[idx(x, y)] == CELL_ALIVE;
}

long Life::population() const
{
    return static_cast<long>(std::count(data.begin(), data.end(), CELL_ALIVE));
}

Pattern Life::snapshot() const
{
    return Eigen::Map<const Pattern>(data.data(), nRows, nCols);
}

std::string Life::toString() const
{
    std::string out;
    out.reserve((static_cast<std::size_t>(nCols) + 1) * nRows);

    for (int y = 0; y < nRows; ++y) {
        for (int x = 0; x < nCols; ++x)
            out += data[idx(x, y)] == CELL_ALIVE ? '*' : ' ';
        out += '\n';
    }
    return out;
}
