#include "specclean/Spectrum.hpp"
#include "specclean/Errors.hpp"
#include "specclean/WavelengthGrid.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace specclean {

void StarSpectrum::check_aligned() const
{
    const auto n = static_cast<std::size_t>(lambda.size());
    if (static_cast<std::size_t>(flux.size()) != n ||
        static_cast<std::size_t>(sigma.size()) != n ||
        bitmask.size() != n)
    {
        throw ShapeMismatchError(
            "StarSpectrum: lambda/flux/sigma/bitmask lengths " +
            std::to_string(lambda.size()) + "/" + std::to_string(flux.size()) + "/" +
            std::to_string(sigma.size()) + "/" + std::to_string(bitmask.size()));
    }
}

/* ---------------------------------------------------------------------- */
namespace {

// rows of doubles, all of them with `ncols` columns
std::vector<std::vector<double>> read_table(const std::string& path, int& ncols)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open '" + path + "'");

    std::vector<std::vector<double>> rows;
    std::string line;
    std::size_t lineno = 0;
    ncols = 0;
    while (std::getline(in, line))
    {
        ++lineno;
        auto it = std::find_if_not(line.begin(), line.end(),
                                   [](unsigned char ch) { return std::isspace(ch) != 0; });
        if (it == line.end() || *it == '#') continue;

        std::istringstream ss(line);
        std::vector<double> row;
        double v;
        while (ss >> v) row.push_back(v);

        if (ncols == 0) ncols = static_cast<int>(row.size());
        if (static_cast<int>(row.size()) != ncols)
            throw ShapeMismatchError("'" + path + "' line " + std::to_string(lineno) +
                                     ": expected " + std::to_string(ncols) +
                                     " columns, found " + std::to_string(row.size()));
        rows.push_back(std::move(row));
    }
    if (rows.empty())
        throw std::runtime_error("File '" + path + "' contains no valid data");
    return rows;
}

int to_flag(double v, const std::string& path)
{
    if (!std::isfinite(v) || v != std::floor(v))
        throw std::runtime_error("'" + path + "': bitmask value " + std::to_string(v) +
                                 " is not an integer");
    return static_cast<int>(v);
}

} // unnamed namespace

StarSpectrum load_star_ascii(const std::string& path)
{
    int ncols = 0;
    const auto rows = read_table(path, ncols);
    if (ncols != 4)
        throw std::runtime_error("load_star_ascii(): '" + path + "' has " +
                                 std::to_string(ncols) +
                                 " columns, need 4 (lambda flux sigma bitmask) "
                                 "or a wavelength solution");

    const Index n = static_cast<Index>(rows.size());
    StarSpectrum sp;
    sp.lambda.resize(n);
    sp.flux.resize(n);
    sp.sigma.resize(n);
    sp.bitmask.resize(rows.size());
    for (Index i = 0; i < n; ++i) {
        const auto& r = rows[static_cast<std::size_t>(i)];
        sp.lambda[i] = r[0];
        sp.flux[i]   = r[1];
        sp.sigma[i]  = r[2];
        sp.bitmask[static_cast<std::size_t>(i)] = to_flag(r[3], path);
    }
    require_strictly_increasing(sp.lambda, "load_star_ascii()");
    return sp;
}

StarSpectrum load_star_ascii(const std::string& path,
                             double wl_start, double wl_delta)
{
    int ncols = 0;
    const auto rows = read_table(path, ncols);
    if (ncols != 3)
        throw std::runtime_error("load_star_ascii(): '" + path + "' has " +
                                 std::to_string(ncols) +
                                 " columns, need 3 (flux sigma bitmask)");

    const Index n = static_cast<Index>(rows.size());
    StarSpectrum sp;
    sp.lambda = log_wavelength_grid(wl_start, wl_delta, n);
    sp.flux.resize(n);
    sp.sigma.resize(n);
    sp.bitmask.resize(rows.size());
    for (Index i = 0; i < n; ++i) {
        const auto& r = rows[static_cast<std::size_t>(i)];
        sp.flux[i]  = r[0];
        sp.sigma[i] = r[1];
        sp.bitmask[static_cast<std::size_t>(i)] = to_flag(r[2], path);
    }
    return sp;
}

} // namespace specclean
