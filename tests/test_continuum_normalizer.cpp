#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "specclean/ContinuumNormalizer.hpp"
#include "specclean/Errors.hpp"
#include "test_helpers.h"

using namespace specclean;
using specclean::test::make_clean_star;
using specclean::test::smooth_continuum;

namespace {

constexpr Index kAnchorStride = 40;

// every kAnchorStride-th pixel is continuum (slightly off-grid), the pixel in
// between is listed as non-continuum
ContinuumReference make_reference(const Vector& lambda) {
    std::vector<double> wl;
    std::vector<int> flag;
    for (Index i = 5; i + 20 < lambda.size(); i += kAnchorStride) {
        wl.push_back(lambda[i] + 0.03);
        flag.push_back(1);
        wl.push_back(lambda[i + 20]);
        flag.push_back(0);
    }
    return ContinuumReference(Eigen::Map<const Vector>(wl.data(), static_cast<Index>(wl.size())),
                              flag);
}

ContinuumNormalizer::Config fit_config() {
    ContinuumNormalizer::Config cfg;
    cfg.interval = Interval(15200.0, 16800.0);
    return cfg;
}

}  // namespace

TEST(ContinuumNormalizerTest, ScaledContinuumNormalizesToOne) {
    const StarSpectrum star = make_clean_star(3.0);
    const ContinuumReference ref = make_reference(star.lambda);
    const ContinuumNormalizer norm(ref, fit_config());

    const NormalizedSpectrum ns = norm.normalize(star);

    const IndexVec cut = select_interval(star.lambda, Interval(15200.0, 16800.0));
    ASSERT_EQ(ns.source_index, cut);
    ASSERT_EQ(ns.size(), static_cast<Index>(cut.size()));
    for (Index i = 0; i < ns.size(); ++i) {
        EXPECT_GT(ns.lambda[i], 15200.0);
        EXPECT_LT(ns.lambda[i], 16800.0);
        EXPECT_NEAR(ns.flux[i], 1.0, 1e-9);
        EXPECT_NEAR(ns.sigma[i], 0.01, 1e-9);
        EXPECT_NEAR(ns.continuum[i], 3.0 * smooth_continuum(ns.lambda[i]), 1e-8);
    }
    EXPECT_EQ(ns.n_bad_pixels, 0u);
    EXPECT_EQ(ns.coefficients.size(), 3);
}

TEST(ContinuumNormalizerTest, AnchorsAreDistinctRawIndicesInsideInterval) {
    const StarSpectrum star = make_clean_star();
    const ContinuumReference ref = make_reference(star.lambda);
    const NormalizedSpectrum ns = ContinuumNormalizer(ref, fit_config()).normalize(star);

    ASSERT_GE(ns.anchor_index.size(), 3u);
    EXPECT_TRUE(std::is_sorted(ns.anchor_index.begin(), ns.anchor_index.end()));
    EXPECT_EQ(std::adjacent_find(ns.anchor_index.begin(), ns.anchor_index.end()),
              ns.anchor_index.end());
    for (Index a : ns.anchor_index) {
        EXPECT_EQ((a - 5) % kAnchorStride, 0);
        EXPECT_GT(star.lambda[a], 15200.0);
        EXPECT_LT(star.lambda[a], 16800.0);
    }
}

TEST(ContinuumNormalizerTest, FlaggedAnchorsDoNotPullTheFit) {
    StarSpectrum star = make_clean_star(2.0);
    const ContinuumReference ref = make_reference(star.lambda);

    // corrupt every third anchor pixel and flag it BADPIX
    std::size_t n_flagged = 0;
    int k = 0;
    for (Index i = 5; i < star.size(); i += kAnchorStride, ++k) {
        if (k % 3 != 0) continue;
        star.flux[i] = 1000.0;
        star.bitmask[static_cast<std::size_t>(i)] = 1;
        if (star.lambda[i] > 15200.0 && star.lambda[i] < 16800.0) ++n_flagged;
    }

    const NormalizedSpectrum ns = ContinuumNormalizer(ref, fit_config()).normalize(star);
    EXPECT_EQ(ns.n_bad_pixels, n_flagged);
    for (Index i = 0; i < ns.size(); ++i) {
        const Index src = ns.source_index[static_cast<std::size_t>(i)];
        if (star.bitmask[static_cast<std::size_t>(src)] != 0) {
            EXPECT_NEAR(ns.sigma[i] * ns.continuum[i], kSentinelError, 1.0);
            continue;
        }
        EXPECT_NEAR(ns.flux[i], 1.0, 1e-6);
    }

    // same data without any significant bit: the outliers dominate
    ContinuumNormalizer::Config cfg = fit_config();
    cfg.bad_pixels = BadPixelSpec();
    const NormalizedSpectrum raw = ContinuumNormalizer(ref, cfg).normalize(star);
    EXPECT_EQ(raw.n_bad_pixels, 0u);
    double worst = 0.0;
    for (Index i = 0; i < raw.size(); ++i) worst = std::max(worst, std::abs(raw.flux[i] - 1.0));
    EXPECT_GT(worst, 1e-2);
}

TEST(ContinuumNormalizerTest, FlaggedCountFollowsBitmaskNotErrorValue) {
    StarSpectrum star = make_clean_star();
    const ContinuumReference ref = make_reference(star.lambda);

    // clean bitmask but an error already at the sentinel value
    const IndexVec cut = select_interval(star.lambda, Interval(15200.0, 16800.0));
    const Index raw_big = cut[10];
    star.sigma[raw_big] = kSentinelError;

    // flagged through a significant bit, raw error left small
    const Index masked = cut[30];
    star.bitmask[static_cast<std::size_t>(masked)] = 1 << 12;

    const NormalizedSpectrum ns = ContinuumNormalizer(ref, fit_config()).normalize(star);
    EXPECT_EQ(ns.n_bad_pixels, 1u);

    ContinuumNormalizer::Config cfg = fit_config();
    cfg.bad_pixels = BadPixelSpec();
    EXPECT_EQ(ContinuumNormalizer(ref, cfg).normalize(star).n_bad_pixels, 0u);
}

TEST(ContinuumNormalizerTest, FinalIntervalRestrictsOutput) {
    const StarSpectrum star = make_clean_star(1.7);
    const ContinuumReference ref = make_reference(star.lambda);
    ContinuumNormalizer::Config cfg = fit_config();
    cfg.final_interval = Interval(15500.0, 15600.0);

    const NormalizedSpectrum ns = ContinuumNormalizer(ref, cfg).normalize(star);
    ASSERT_EQ(ns.source_index, select_interval(star.lambda, Interval(15500.0, 15600.0)));
    for (Index i = 0; i < ns.size(); ++i) {
        EXPECT_DOUBLE_EQ(ns.lambda[i], star.lambda[ns.source_index[static_cast<std::size_t>(i)]]);
        EXPECT_NEAR(ns.flux[i], 1.0, 1e-9);
    }
}

TEST(ContinuumNormalizerTest, FinalIntervalOutsideFitWindowThrows) {
    const StarSpectrum star = make_clean_star();
    const ContinuumReference ref = make_reference(star.lambda);
    ContinuumNormalizer::Config cfg = fit_config();
    cfg.final_interval = Interval(16850.0, 16950.0);
    EXPECT_THROW(ContinuumNormalizer(ref, cfg).normalize(star), EmptyIntervalError);
}

TEST(ContinuumNormalizerTest, FitContinuumMatchesModel) {
    const StarSpectrum star = make_clean_star(4.0);
    const ContinuumReference ref = make_reference(star.lambda);
    const ContinuumModel m = ContinuumNormalizer(ref, fit_config()).fit_continuum(star);
    EXPECT_NEAR(m(16000.0), 4.0 * smooth_continuum(16000.0), 1e-8);
    EXPECT_GT(m.window_lo(), 15200.0);
    EXPECT_LT(m.window_hi(), 16800.0);
}

TEST(ContinuumNormalizerTest, EmptyIntervalThrows) {
    const StarSpectrum star = make_clean_star();
    const ContinuumReference ref = make_reference(star.lambda);
    ContinuumNormalizer::Config cfg;
    cfg.interval = Interval(18000.0, 19000.0);
    EXPECT_THROW(ContinuumNormalizer(ref, cfg).normalize(star), EmptyIntervalError);

    // reversed bounds select nothing and fail the same way
    cfg.interval = Interval(16800.0, 15200.0);
    EXPECT_THROW(ContinuumNormalizer(ref, cfg).normalize(star), EmptyIntervalError);
}

TEST(ContinuumNormalizerTest, TooFewAnchorsThrows) {
    const StarSpectrum star = make_clean_star();

    // only two continuum wavelengths inside the interval
    Vector wl(3);
    wl << star.lambda[1000], star.lambda[2000], 17500.0;
    const ContinuumReference two(wl, {1, 1, 1});
    EXPECT_THROW(ContinuumNormalizer(two, fit_config()).normalize(star), DegenerateFitError);

    // many continuum wavelengths, all collapsing onto one pixel
    Vector close(4);
    const double c = star.lambda[3000];
    close << c - 0.01, c - 0.005, c + 0.005, c + 0.01;
    const ContinuumReference same(close, {1, 1, 1, 1});
    EXPECT_THROW(ContinuumNormalizer(same, fit_config()).normalize(star), DegenerateFitError);
}

TEST(ContinuumNormalizerTest, ZeroContinuumThrows) {
    StarSpectrum star = make_clean_star();
    star.flux.setZero();
    star.sigma.setOnes();
    const ContinuumReference ref = make_reference(star.lambda);

    ContinuumNormalizer::Config cfg = fit_config();
    cfg.degree = 0;
    EXPECT_THROW(ContinuumNormalizer(ref, cfg).normalize(star), DegenerateFitError);
}

TEST(ContinuumNormalizerTest, ZeroErrorAtAnchorThrows) {
    StarSpectrum star = make_clean_star();
    const ContinuumReference ref = make_reference(star.lambda);
    for (Index i = 5; i < star.size(); i += kAnchorStride)
        if (star.lambda[i] > 15200.0 && star.lambda[i] < 16800.0) {
            star.sigma[i] = 0.0;
            break;
        }
    EXPECT_THROW(ContinuumNormalizer(ref, fit_config()).normalize(star), DegenerateFitError);
}

TEST(ContinuumNormalizerTest, MisalignedInputThrows) {
    StarSpectrum star = make_clean_star();
    const ContinuumReference ref = make_reference(star.lambda);
    star.bitmask.pop_back();
    EXPECT_THROW(ContinuumNormalizer(ref, fit_config()).normalize(star), ShapeMismatchError);
}
