#pragma once
#include "Types.hpp"
#include <string>
#include <vector>

namespace specclean {

// One star's raw spectrum as handed over by the data-access layer
struct StarSpectrum {
    Vector   lambda;       // Å, strictly increasing (log-spaced)
    Vector   flux;         // arbitrary units
    Vector   sigma;        // 1-σ uncertainties (same units as flux)
    Bitmask  bitmask;      // APOGEE_PIXMASK, one entry per pixel

    Index size() const { return lambda.size(); }

    // ShapeMismatchError unless all four arrays have the same length
    void check_aligned() const;
};

/*
 * Plain-text star spectrum, '#' comments, whitespace separated:
 *
 *     lambda  flux  sigma  bitmask       (4 columns)
 *     flux  sigma  bitmask               (3 columns, λ from the log grid)
 */
StarSpectrum load_star_ascii(const std::string& path);
StarSpectrum load_star_ascii(const std::string& path,
                             double wl_start, double wl_delta);

} // namespace specclean
