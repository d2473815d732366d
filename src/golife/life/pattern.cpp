#include "pattern.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

std::vector<std::vector<int>> readRows(std::istream& in, const std::string& source)
{
    std::vector<std::vector<int>> rows;
    std::string line;
    int lineNo = 0;

    while (std::getline(in, line))
    {
        ++lineNo;
        std::vector<int> row;
        std::istringstream iss(line);
        std::string token;

        while (iss >> token)
        {
            std::size_t used = 0;
            int value = 0;
            try {
                value = std::stoi(token, &used);
            } catch (const std::logic_error&) {
                used = 0;
            }
            if (used == 0 || used != token.size())
                throw std::runtime_error(source + ":" + std::to_string(lineNo) +
                                         ": not an integer: '" + token + "'");
            row.push_back(value);
        }

        if (!row.empty())
            rows.push_back(row);
    }

    if (rows.empty())
        throw std::runtime_error("Empty grid: " + source);

    return rows;
}

} // namespace

std::vector<std::vector<int>> parsePattern(const std::string& text)
{
    std::istringstream in(text);
    return readRows(in, "<string>");
}

std::vector<std::vector<int>> loadPattern(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
        throw std::runtime_error("Error opening file: " + filename);

    return readRows(file, filename);
}

void savePattern(const Life& life, const std::string& filename)
{
    std::ofstream file(filename);
    if (!file.is_open())
        throw std::runtime_error("Error opening file for writing: " + filename);

    for (int y = 0; y < life.rows(); y++)
    {
        for (int x = 0; x < life.cols(); x++)
        {
            file << (life.alive(x, y) ? 1 : 0);
            if (x < life.cols() - 1)
                file << " ";
        }
        file << "\n";
    }

    if (!file)
        throw std::runtime_error("Error writing file: " + filename);
}
