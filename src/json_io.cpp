#include "json_io.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace vrpeasy
{

    json load_json(const std::string &path)
    {
        std::ifstream in(path);
        if (!in)
            throw std::runtime_error("Cannot open file: " + path);
        json j;
        in >> j;
        return j;
    }

    void save_json(const std::string &path, const json &j, int indent)
    {
        const fs::path parent = fs::path(path).parent_path();
        if (!parent.empty())
            fs::create_directories(parent);
        std::ofstream out(path);
        if (!out)
            throw std::runtime_error("Cannot write file: " + path);
        out << j.dump(indent) << "\n";
        if (!out)
            throw std::runtime_error("Failed writing file: " + path);
    }

} // namespace vrpeasy
