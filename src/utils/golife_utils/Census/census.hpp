#pragma once

#include <Eigen/Dense>

#include "life.hpp"

/* Population statistics over a grid snapshot (rows x cols, 0/1). */

long population(const Pattern& pattern);

double density(const Pattern& pattern);

// Alive neighbours of every cell under the given edge policy.
Eigen::MatrixXi neighborCounts(const Pattern& pattern, EdgePolicy edge);

// Alive fraction of each block x block tile. Partial tiles on the right and
// bottom edges average over the cells they actually cover.
Eigen::MatrixXd blockDensity(const Pattern& pattern, int block);
