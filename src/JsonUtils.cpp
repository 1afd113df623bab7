#include "mbbfit/JsonUtils.hpp"
#include "mbbfit/Errors.hpp"
#include <fstream>
#include <regex>
#include <cstdlib>

namespace mbbfit {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw ConfigError("Cannot open '" + path + "'");

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Error parsing JSON from " + path + ": " + e.what());
    }
    return j;
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    std::size_t pos = 0;
    /*  substituted text is not rescanned                                  */
    while (std::regex_search(out.cbegin() + pos, out.cend(), m, re)) {
        const std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        const std::string value = env ? env : "";
        const std::size_t start = pos + static_cast<std::size_t>(m.position(0));
        out.replace(start, static_cast<std::size_t>(m.length(0)), value);
        pos = start + value.size();
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

} // namespace mbbfit
