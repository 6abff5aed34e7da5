#pragma once
#include "ContinuumNormalizer.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace specclean {

nlohmann::json load_json(const std::string& path);
void expand_env(nlohmann::json& j);          // ${VAR} → value of VAR (or "")

/*
 * Run configuration, e.g.
 *
 *   {
 *     "referencePath"  : "${SPECCLEAN_DATA}/continuum_pixels.fits",
 *     "referenceFormat": "auto",
 *     "interval"       : [15150.0, 15800.0],
 *     "finalInterval"  : [15200.0, 15750.0],
 *     "degree"         : 2,
 *     "badPixels"      : [0, 1, 2, "SIG_SKYLINE"],     // or {"0": true, "8": false}
 *     "verbose"        : true
 *   }
 *
 * Every key is optional.
 */
struct RunConfig {
    ContinuumNormalizer::Config normalizer;
    std::string                 reference_path;
    std::string                 reference_format = "auto";
};

BadPixelSpec bad_pixels_from_json(const nlohmann::json& j);
RunConfig    run_config_from_json(const nlohmann::json& j);
RunConfig    load_run_config(const std::string& path);   // load_json + expand_env

} // namespace specclean
