#pragma once

#include <vector>
#include <random>
#include <string>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

#include <Eigen/Core>

// ---- Cell States ---- //
enum CellState : uint8_t {
    CELL_DEAD  = 0,
    CELL_ALIVE = 1
};

// ---- Edge Policies ---- //
enum EdgePolicy : uint8_t {
    EDGE_TORUS = 0,  // neighbours wrap to the opposite edge
    EDGE_DEAD  = 1   // neighbours outside the grid are dead
};

// ---- Errors ---- //
class InvalidDimensions : public std::invalid_argument {
public:
    explicit InvalidDimensions(const std::string& what)
        : std::invalid_argument(what) {}
};

class OutOfBounds : public std::out_of_range {
public:
    explicit OutOfBounds(const std::string& what)
        : std::out_of_range(what) {}
};

// ---- Parameters ---- //
struct LifeParameters {
    EdgePolicy edge{EDGE_TORUS};
    double fill{0.25};  // random placements per cell when seeding, [0, 1]
};

// rows x cols, 0/1 per cell
using Pattern =
    Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// ---- Life ---- //
class Life {
private:
    int nCols{0}, nRows{0};
    LifeParameters params;
    unsigned long gen{0};

    // row-major flattened storage
    std::vector<uint8_t> data;
    std::vector<uint8_t> next;

    inline std::size_t idx(int x, int y) const {
        return static_cast<std::size_t>(y) * nCols + x;
    }

    void allocate(int cols, int rows);
    void seed(std::mt19937& rng);
    int countNeighbors(int x, int y) const;

    // Rewinds to generation 0 with the given cells, in place.
    void restore(const Pattern& pattern);
    friend class Universe;

public:
    // Random seed drawn from std::random_device.
    Life(int cols, int rows, const LifeParameters& params = LifeParameters());

    // Deterministic seed.
    Life(int cols, int rows, uint32_t seed,
         const LifeParameters& params = LifeParameters());

    // Explicit pattern, one inner vector per row.
    Life(const std::vector<std::vector<int>>& pattern,
         const LifeParameters& params = LifeParameters());

    Life(const Pattern& pattern,
         const LifeParameters& params = LifeParameters());

    void step();
    void step(int n);

    // Throws OutOfBounds outside [0, cols) x [0, rows).
    bool alive(int x, int y) const;

    // ---- Accessors ---- //
    int cols() const noexcept { return nCols; }
    int rows() const noexcept { return nRows; }
    unsigned long generation() const noexcept { return gen; }
    EdgePolicy edge() const noexcept { return params.edge; }
    const LifeParameters& parameters() const noexcept { return params; }

    long population() const;
    Pattern snapshot() const;
    std::string toString() const;

    const std::vector<uint8_t>& raw() const noexcept { return data; }
};
