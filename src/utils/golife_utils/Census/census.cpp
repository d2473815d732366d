#include "census.hpp"
#include <stdexcept>
#include <algorithm>

namespace {

void requireCells(const Pattern& pattern)
{
    if (pattern.rows() == 0 || pattern.cols() == 0)
        throw InvalidDimensions("Pattern must be non-empty");
}

} // namespace

/* ------------------ population ------------------ */
long population(const Pattern& pattern)
{
    requireCells(pattern);
    return static_cast<long>(pattern.cast<long>().sum());
}

double density(const Pattern& pattern)
{
    requireCells(pattern);
    return static_cast<double>(population(pattern)) /
           static_cast<double>(pattern.size());
}

/* ------------------ neighbour counts ------------------ */
Eigen::MatrixXi neighborCounts(const Pattern& pattern, EdgePolicy edge)
{
    requireCells(pattern);

    const Eigen::Index R = pattern.rows();
    const Eigen::Index C = pattern.cols();
    const Eigen::MatrixXi cells = pattern.cast<int>();
    Eigen::MatrixXi counts = Eigen::MatrixXi::Zero(R, C);

    // Sum the eight shifted copies of the grid.
    for (int dr = -1; dr <= 1; ++dr)
    for (int dc = -1; dc <= 1; ++dc)
    {
        if (dr == 0 && dc == 0) continue;

        for (Eigen::Index i = 0; i < R; ++i)
        {
            Eigen::Index si = i + dr;
            if (edge == EDGE_TORUS)
                si = ((si % R) + R) % R;
            else if (si < 0 || si >= R)
                continue;

            for (Eigen::Index j = 0; j < C; ++j)
            {
                Eigen::Index sj = j + dc;
                if (edge == EDGE_TORUS)
                    sj = ((sj % C) + C) % C;
                else if (sj < 0 || sj >= C)
                    continue;

                counts(i, j) += cells(si, sj);
            }
        }
    }
    return counts;
}

/* ------------------ block density ------------------ */
Eigen::MatrixXd blockDensity(const Pattern& pattern, int block)
{
    requireCells(pattern);
    if (block <= 0)
        throw std::invalid_argument("block must be positive");

    const Eigen::Index R = pattern.rows();
    const Eigen::Index C = pattern.cols();
    const Eigen::Index BR = (R + block - 1) / block;
    const Eigen::Index BC = (C + block - 1) / block;

    const Eigen::MatrixXd cells = pattern.cast<double>();
    Eigen::MatrixXd out(BR, BC);

    for (Eigen::Index bi = 0; bi < BR; ++bi)
    {
        for (Eigen::Index bj = 0; bj < BC; ++bj)
        {
            const Eigen::Index r0 = bi * block;
            const Eigen::Index c0 = bj * block;
            const Eigen::Index h = std::min<Eigen::Index>(block, R - r0);
            const Eigen::Index w = std::min<Eigen::Index>(block, C - c0);
            out(bi, bj) = cells.block(r0, c0, h, w).mean();
        }
    }
    return out;
}
