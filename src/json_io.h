// json_io.h
#pragma once
#include <string>

#include <nlohmann/json.hpp>

namespace vrpeasy
{

using json = nlohmann::json;

json load_json(const std::string &path);

// Creates missing parent directories. Indent of 1 matches the engine documents.
void save_json(const std::string &path, const json &j, int indent = 1);

} // namespace vrpeasy
