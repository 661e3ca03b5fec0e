// instance_io.h
#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "entities.h"
#include "model.h"

namespace vrpeasy
{

using json = nlohmann::json;

// Builds a model from a request-shaped document (compact or exported form)
// through the regular add_* operations. A member of the wrong JSON type raises
// ValidationError(kType) naming it; absent members take their documented default.
Model load_model(const json &doc);
Model load_model_file(const std::string &path);

// Overwrites the parameters present in j, leaving the others untouched.
void apply_parameters(const json &j, Parameters &parameters);

} // namespace vrpeasy
