#pragma once

#include <string>
#include <vector>

#include "life.hpp"

// Grid text format: one row per non-empty line, whitespace-separated 0/1.

std::vector<std::vector<int>> parsePattern(const std::string& text);

std::vector<std::vector<int>> loadPattern(const std::string& filename);

void savePattern(const Life& life, const std::string& filename);
