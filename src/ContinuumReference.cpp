#include "specclean/ContinuumReference.hpp"
#include "specclean/Errors.hpp"
#include "specclean/Config.hpp"

#include <CCfits/CCfits>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <sstream>
#include <unordered_map>

namespace fs = std::filesystem;

namespace specclean {

/* ---------------------------------------------------------------------- */
ContinuumReference::ContinuumReference(Vector wavelength,
                                       std::vector<int> is_continuum,
                                       std::string source)
    : source_(std::move(source))
{
    if (static_cast<std::size_t>(wavelength.size()) != is_continuum.size())
        throw ShapeMismatchError(
            "ContinuumReference(" + source_ + "): " + std::to_string(wavelength.size()) +
            " wavelengths but " + std::to_string(is_continuum.size()) + " continuum flags");

    for (Index i = 0; i < wavelength.size(); ++i)
        if (!std::isfinite(wavelength[i]))
            throw MissingReferenceError("ContinuumReference(" + source_ +
                                        "): non-finite wavelength in row " + std::to_string(i));

    /* ---------- sort rows by wavelength ------------------------------- */
    const std::size_t n = is_continuum.size();
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(),
                     [&](std::size_t a, std::size_t b)
                     { return wavelength[static_cast<Index>(a)] < wavelength[static_cast<Index>(b)]; });

    wavelength_.resize(static_cast<Index>(n));
    is_continuum_.resize(n);
    std::vector<double> cont;
    for (std::size_t k = 0; k < n; ++k) {
        wavelength_[static_cast<Index>(k)] = wavelength[static_cast<Index>(idx[k])];
        is_continuum_[k] = is_continuum[idx[k]] != 0 ? 1 : 0;
        if (is_continuum_[k]) {
            const double w = wavelength_[static_cast<Index>(k)];
            if (cont.empty() || w > cont.back()) cont.push_back(w);   // drop duplicates
        }
    }
    cont_wavelength_ = Eigen::Map<const Vector>(cont.data(), static_cast<Index>(cont.size()));
}

/* ====================================================================== */
ContinuumReference load_reference_ascii(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw MissingReferenceError("load_reference_ascii(): cannot open '" + path + "'");

    std::vector<double> wl;
    std::vector<int>    flag;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line))
    {
        ++lineno;
        auto it = std::find_if_not(line.begin(), line.end(),
                                   [](unsigned char ch) { return std::isspace(ch) != 0; });
        if (it == line.end() || *it == '#') continue;

        std::istringstream ss(line);
        double w;
        std::string f;
        if (!(ss >> w >> f))
            throw MissingReferenceError("load_reference_ascii(): '" + path + "' line " +
                                        std::to_string(lineno) + " is not 'wavelength flag'");

        std::transform(f.begin(), f.end(), f.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        int v;
        if (f == "1" || f == "true" || f == "t")       v = 1;
        else if (f == "0" || f == "false" || f == "f") v = 0;
        else
            throw MissingReferenceError("load_reference_ascii(): '" + path + "' line " +
                                        std::to_string(lineno) + ": bad flag '" + f + "'");
        wl.push_back(w);
        flag.push_back(v);
    }
    if (wl.empty())
        throw MissingReferenceError("load_reference_ascii(): '" + path + "' has no rows");

    return ContinuumReference(Eigen::Map<const Vector>(wl.data(), static_cast<Index>(wl.size())),
                              std::move(flag), path);
}

/* ---------------------------------------------------------------------- */
ContinuumReference load_reference_json(const std::string& path)
{
    if (!fs::exists(path))
        throw MissingReferenceError("load_reference_json(): '" + path + "' not found");

    try {
        const nlohmann::json j = load_json(path);
        const auto wl   = j.at("wavelength").get<std::vector<double>>();
        std::vector<int> flag;
        for (const auto& v : j.at("is_continuum"))
            flag.push_back(v.is_boolean() ? (v.get<bool>() ? 1 : 0) : (v.get<int>() != 0));

        return ContinuumReference(Eigen::Map<const Vector>(wl.data(), static_cast<Index>(wl.size())),
                                  std::move(flag), path);
    }
    catch (const nlohmann::json::exception& e) {
        throw MissingReferenceError("load_reference_json(): '" + path + "': " + e.what());
    }
}

/* ---------------------------------------------------------------------- */
ContinuumReference load_reference_fits(const std::string& path)
{
    if (!fs::exists(path))
        throw MissingReferenceError("load_reference_fits(): '" + path + "' not found");

    try {
        CCfits::FITS f(path, CCfits::Read, true);
        CCfits::ExtHDU& ext = f.extension(1);
        const long nrows = ext.rows();

        std::vector<double> wl;
        ext.column("wavelength", false).read(wl, 1, nrows);

        CCfits::Column& fc = ext.column("is_continuum", false);
        std::vector<int> flag;
        if (fc.type() == CCfits::Tlogical) {
            std::vector<bool> b;
            fc.read(b, 1, nrows);
            flag.assign(b.begin(), b.end());
        } else {
            std::vector<double> d;
            fc.read(d, 1, nrows);
            for (double v : d) flag.push_back(v != 0.0 ? 1 : 0);
        }

        return ContinuumReference(Eigen::Map<const Vector>(wl.data(), static_cast<Index>(wl.size())),
                                  std::move(flag), path);
    }
    catch (const CCfits::FitsException& e) {
        throw MissingReferenceError("load_reference_fits(): '" + path + "': " + e.message());
    }
}

/* ====================================================================== */
static const std::unordered_map<std::string, ReferenceLoader> kReferenceLoaders = {
    {"ascii", load_reference_ascii},
    {"json",  load_reference_json},
    {"fits",  load_reference_fits}
};

static std::string format_from_extension(const std::string& path)
{
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json")                                     return "json";
    if (ext == ".fits" || ext == ".fit" || ext == ".fts")   return "fits";
    return "ascii";
}

ContinuumReference load_reference(const std::string& path, const std::string& format)
{
    const std::string fmt = (format == "auto") ? format_from_extension(path) : format;

    auto it = kReferenceLoaders.find(fmt);
    if (it == kReferenceLoaders.end())
        throw std::invalid_argument("Unsupported continuum reference format: " + format);

    return it->second(path);
}

} // namespace specclean
