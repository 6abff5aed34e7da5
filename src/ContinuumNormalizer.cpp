#include "specclean/ContinuumNormalizer.hpp"
#include "specclean/ErrorInflation.hpp"
#include "specclean/Errors.hpp"
#include "specclean/NearestMatch.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace specclean {

ContinuumNormalizer::ContinuumNormalizer(const ContinuumReference& reference,
                                         Config config)
    : reference_(reference), cfg_(std::move(config))
{
    if (cfg_.degree < 0)
        throw std::invalid_argument("ContinuumNormalizer: negative polynomial degree");
}

/* ---------------------------------------------------------------------- */
ContinuumNormalizer::Cut ContinuumNormalizer::cut_(const StarSpectrum& star) const
{
    star.check_aligned();

    /* ---------- 1. inflate errors of flagged pixels ------------------- */
    const Vector sigma = inflate_errors(star.sigma, star.bitmask, cfg_.bad_pixels);

    /* ---------- 2. restrict to the fit interval ----------------------- */
    Cut c;
    c.idx = select_interval(star.lambda, cfg_.interval);
    if (c.idx.empty()) {
        std::ostringstream s;
        s << "normalize(): interval " << cfg_.interval.str() << " selects no pixel of a "
          << star.size() << "-pixel spectrum";
        if (star.size() > 0)
            s << " covering [" << star.lambda[0] << ", " << star.lambda[star.size() - 1] << ']';
        throw EmptyIntervalError(s.str());
    }

    c.lambda = take(star.lambda, c.idx);
    c.flux   = take(star.flux,   c.idx);
    c.sigma  = take(sigma,       c.idx);
    c.n_bad  = count_bad_pixels(take(star.bitmask, c.idx), cfg_.bad_pixels);
    return c;
}

/* ---------------------------------------------------------------------- */
ContinuumNormalizer::Fit ContinuumNormalizer::fit_(const StarSpectrum& star) const
{
    Cut c = cut_(star);

    /* ---------- 3. continuum anchors inside the same interval --------- */
    const Vector& cont_all = reference_.continuum_wavelengths();
    const Vector  cont     = take(cont_all, select_interval(cont_all, cfg_.interval));

    IndexVec anchors = nearest_indices(cont, c.lambda);
    anchors.erase(std::unique(anchors.begin(), anchors.end()), anchors.end());

    const std::size_t need = static_cast<std::size_t>(cfg_.degree) + 1;
    if (anchors.size() < need) {
        std::ostringstream s;
        s << "normalize(): " << anchors.size() << " distinct continuum anchors ("
          << cont.size() << " reference wavelengths) in " << cfg_.interval.str()
          << ", need " << need << " for a degree-" << cfg_.degree << " fit";
        throw DegenerateFitError(s.str());
    }

    Vector ax(static_cast<Index>(anchors.size()));
    Vector ay(ax.size());
    Vector aw(ax.size());
    for (std::size_t k = 0; k < anchors.size(); ++k) {
        const Index j  = anchors[k];
        const Index kk = static_cast<Index>(k);
        if (!(c.sigma[j] > 0.0) || !std::isfinite(c.sigma[j])) {
            std::ostringstream s;
            s << "normalize(): anchor at " << c.lambda[j] << " A has error "
              << c.sigma[j] << ", weights need a positive finite error";
            throw DegenerateFitError(s.str());
        }
        ax[kk] = c.lambda[j];
        ay[kk] = c.flux[j];
        aw[kk] = 1.0 / c.sigma[j];
    }

    /* ---------- 4. weighted fit, window = restricted λ range --------- */
    ContinuumModel model = ContinuumModel::fit(ax, ay, aw, cfg_.degree,
                                               c.lambda[0], c.lambda[c.lambda.size() - 1]);

    if (cfg_.verbose) {
        std::cout << "Continuum fit in " << cfg_.interval.str() << ": "
                  << c.lambda.size() << " pixels, " << c.n_bad << " flagged, "
                  << anchors.size() << " anchors, coeffs ["
                  << model.coefficients().transpose() << "]\n";
    }

    return Fit{std::move(c), std::move(anchors), std::move(model)};
}

ContinuumModel ContinuumNormalizer::fit_continuum(const StarSpectrum& star) const
{
    return fit_(star).model;
}

/* ---------------------------------------------------------------------- */
NormalizedSpectrum ContinuumNormalizer::normalize(const StarSpectrum& star) const
{
    Fit f = fit_(star);
    const Cut& c = f.cut;

    NormalizedSpectrum out;
    out.coefficients = f.model.coefficients();
    out.n_bad_pixels = c.n_bad;
    out.anchor_index.reserve(f.anchors.size());
    for (Index j : f.anchors) out.anchor_index.push_back(c.idx[static_cast<std::size_t>(j)]);

    /* ---------- 5. pixels to evaluate -------------------------------- */
    Vector lam, flux, sigma;
    if (cfg_.final_interval) {
        // final window, clipped to the fit window
        for (Index i : select_interval(star.lambda, *cfg_.final_interval)) {
            const double l = star.lambda[i];
            if (l >= f.model.window_lo() && l <= f.model.window_hi())
                out.source_index.push_back(i);
        }
        if (out.source_index.empty())
            throw EmptyIntervalError("normalize(): final interval " +
                                     cfg_.final_interval->str() +
                                     " has no pixel inside the fit interval " +
                                     cfg_.interval.str());

        // the fit interval contains every kept index, so c.idx can be searched
        const IndexVec pos = [&] {
            IndexVec p;
            p.reserve(out.source_index.size());
            for (Index i : out.source_index)
                p.push_back(std::lower_bound(c.idx.begin(), c.idx.end(), i) - c.idx.begin());
            return p;
        }();
        lam   = take(c.lambda, pos);
        flux  = take(c.flux,   pos);
        sigma = take(c.sigma,  pos);
    } else {
        out.source_index = c.idx;
        lam   = c.lambda;
        flux  = c.flux;
        sigma = c.sigma;
    }

    out.continuum = f.model.evaluate(lam);

    /* ---------- 6. divide by the continuum --------------------------- */
    for (Index i = 0; i < out.continuum.size(); ++i) {
        const double v = out.continuum[i];
        if (v == 0.0 || !std::isfinite(v)) {
            std::ostringstream s;
            s << "normalize(): continuum is " << v << " at " << lam[i]
              << " A, cannot divide";
            throw DegenerateFitError(s.str());
        }
    }

    out.lambda = std::move(lam);
    out.flux   = flux.cwiseQuotient(out.continuum);
    out.sigma  = sigma.cwiseQuotient(out.continuum);
    return out;
}

} // namespace specclean
