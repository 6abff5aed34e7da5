#include "specclean/Config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>
#include <regex>
#include <stdexcept>
#include <vector>

namespace specclean {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open()) throw std::runtime_error("Cannot open: " + path);
    nlohmann::json j;
    f >> j;
    return j;
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        const char* env = std::getenv(m.str(1).c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
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

/* ---------------------------------------------------------------------- */
static Interval interval_from_json(const nlohmann::json& j, const char* key)
{
    if (!j.is_array() || j.size() != 2)
        throw std::runtime_error(std::string("config: '") + key + "' must be [lo, hi]");
    return Interval(j[0].get<double>(), j[1].get<double>());
}

BadPixelSpec bad_pixels_from_json(const nlohmann::json& j)
{
    if (j.is_null())
        return BadPixelSpec::apogee_default();

    // {"0": true, "8": false, ...}
    if (j.is_object()) {
        std::map<int, bool> sig;
        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string& k = it.key();
            const int bit = (!k.empty() && std::isdigit(static_cast<unsigned char>(k[0])))
                            ? std::stoi(k) : pixmask_bit_from_name(k);
            sig[bit] = it.value().get<bool>();
        }
        return BadPixelSpec(sig);
    }

    // [0, 1, "SIG_SKYLINE", ...]
    if (j.is_array()) {
        const bool all_names = !j.empty() &&
            std::all_of(j.begin(), j.end(), [](const nlohmann::json& el) { return el.is_string(); });
        if (all_names)
            return BadPixelSpec::from_names(j.get<std::vector<std::string>>());

        std::vector<int> bits;
        for (const auto& el : j)
            bits.push_back(el.is_string() ? pixmask_bit_from_name(el.get<std::string>())
                                          : el.get<int>());
        return BadPixelSpec(bits);
    }

    // raw combined mask, e.g. 4351
    if (j.is_number_unsigned() || j.is_number_integer())
        return BadPixelSpec::from_mask(j.get<std::uint32_t>());

    throw std::runtime_error("config: 'badPixels' must be a list, an object or a mask");
}

RunConfig run_config_from_json(const nlohmann::json& j)
{
    RunConfig rc;
    auto& nc = rc.normalizer;

    if (j.contains("interval"))
        nc.interval = interval_from_json(j["interval"], "interval");
    if (j.contains("finalInterval") && !j["finalInterval"].is_null())
        nc.final_interval = interval_from_json(j["finalInterval"], "finalInterval");
    if (j.contains("degree"))
        nc.degree = j["degree"].get<int>();
    if (j.contains("badPixels"))
        nc.bad_pixels = bad_pixels_from_json(j["badPixels"]);
    if (j.contains("verbose"))
        nc.verbose = j["verbose"].get<bool>();

    if (j.contains("referencePath"))
        rc.reference_path = j["referencePath"].get<std::string>();
    if (j.contains("referenceFormat"))
        rc.reference_format = j["referenceFormat"].get<std::string>();

    if (nc.degree < 0)
        throw std::runtime_error("config: 'degree' must be >= 0");
    return rc;
}

RunConfig load_run_config(const std::string& path)
{
    nlohmann::json j = load_json(path);
    expand_env(j);
    return run_config_from_json(j);
}

} // namespace specclean
