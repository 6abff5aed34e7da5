#pragma once
#include "Types.hpp"
#include "BadPixelSpec.hpp"
#include "ContinuumModel.hpp"
#include "ContinuumReference.hpp"
#include "Interval.hpp"
#include "Spectrum.hpp"
#include <optional>
#include <vector>

namespace specclean {

// Result of one normalisation, restricted to the output window
struct NormalizedSpectrum {
    Vector   lambda;          // Å
    Vector   flux;            // flux / continuum
    Vector   sigma;           // inflated σ / continuum
    Vector   continuum;       // polynomial evaluated at lambda
    IndexVec source_index;    // position of every output pixel in the raw arrays
    IndexVec anchor_index;    // raw-array indices used as fit anchors (distinct)
    Vector   coefficients;    // in the mapped variable, see ContinuumModel
    std::size_t n_bad_pixels = 0;   // pixels inflated inside the fit interval

    Index size() const { return lambda.size(); }
};

/*
 * error inflation → interval cut → nearest-match anchors → weighted
 * polynomial fit → division by the continuum.
 *
 * One call handles one star and keeps no state between calls.  The
 * reference table is borrowed and must outlive the normaliser.
 */
class ContinuumNormalizer {
public:
    struct Config
    {
        Interval                interval{15000.0, 17000.0};   // fit window (open)
        std::optional<Interval> final_interval;               // output window, default = interval
        BadPixelSpec            bad_pixels = BadPixelSpec::apogee_default();
        int                     degree     = 2;
        bool                    verbose    = false;
    };

    ContinuumNormalizer(const ContinuumReference& reference, Config config);

    NormalizedSpectrum normalize(const StarSpectrum& star) const;

    // only the fit, no division
    ContinuumModel fit_continuum(const StarSpectrum& star) const;

    const Config& config() const { return cfg_; }

private:
    struct Cut {
        IndexVec idx;           // raw indices inside cfg_.interval
        Vector   lambda, flux, sigma;
        std::size_t n_bad = 0;
    };
    struct Fit {
        Cut            cut;
        IndexVec       anchors;   // positions inside cut, distinct
        ContinuumModel model;
    };

    Cut cut_(const StarSpectrum& star) const;
    Fit fit_(const StarSpectrum& star) const;

    const ContinuumReference& reference_;
    Config                    cfg_;
};

} // namespace specclean
