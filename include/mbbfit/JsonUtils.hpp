#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace mbbfit {
/*  parse a JSON file; throws ConfigError with the path on failure          */
nlohmann::json load_json(const std::string& path);
/*  replace ${VAR} in every string value by the environment variable        */
void expand_env(nlohmann::json& j);
} // namespace mbbfit
