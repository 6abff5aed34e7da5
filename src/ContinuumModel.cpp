#include "specclean/ContinuumModel.hpp"
#include "specclean/Errors.hpp"
#include <boost/math/tools/rational.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

namespace specclean {

static void check_window(double w0, double w1)
{
    if (!std::isfinite(w0) || !std::isfinite(w1) || !(w1 > w0)) {
        std::ostringstream s;
        s << "ContinuumModel: fit window [" << w0 << ", " << w1 << "] has no extent";
        throw DegenerateFitError(s.str());
    }
}

ContinuumModel::ContinuumModel(Vector coeffs, double window_lo, double window_hi)
    : coeffs_(std::move(coeffs)), w0_(window_lo), w1_(window_hi)
{
    check_window(w0_, w1_);
    if (coeffs_.size() == 0)
        throw std::invalid_argument("ContinuumModel: no coefficients");
}

double ContinuumModel::map_(double lambda) const
{
    return (2.0 * lambda - (w0_ + w1_)) / (w1_ - w0_);
}

double ContinuumModel::operator()(double lambda) const
{
    return boost::math::tools::evaluate_polynomial(
        coeffs_.data(), map_(lambda), static_cast<std::size_t>(coeffs_.size()));
}

Vector ContinuumModel::evaluate(const Vector& lambda) const
{
    Vector out(lambda.size());
    for (Index i = 0; i < lambda.size(); ++i) out[i] = operator()(lambda[i]);
    return out;
}

/* ---------------------------------------------------------------------- */
ContinuumModel ContinuumModel::fit(const Vector& x,
                                   const Vector& y,
                                   const Vector& w,
                                   int           degree,
                                   double        window_lo,
                                   double        window_hi)
{
    if (degree < 0)
        throw std::invalid_argument("ContinuumModel::fit(): negative degree");
    if (x.size() != y.size() || x.size() != w.size())
        throw ShapeMismatchError(
            "ContinuumModel::fit(): x/y/w lengths " + std::to_string(x.size()) + "/" +
            std::to_string(y.size()) + "/" + std::to_string(w.size()));
    check_window(window_lo, window_hi);

    const Index ncoef = degree + 1;

    /* ---------- enough distinct abscissae? --------------------------- */
    std::vector<double> xs(x.data(), x.data() + x.size());
    std::sort(xs.begin(), xs.end());
    const auto n_distinct = std::unique(xs.begin(), xs.end()) - xs.begin();
    if (n_distinct < ncoef)
        throw DegenerateFitError(
            "ContinuumModel::fit(): " + std::to_string(n_distinct) +
            " distinct anchor points (" + std::to_string(x.size()) +
            " total), need at least " + std::to_string(ncoef) +
            " for degree " + std::to_string(degree));

    for (Index i = 0; i < w.size(); ++i) {
        if (!std::isfinite(w[i]) || w[i] < 0.0 || !std::isfinite(y[i]))
            throw DegenerateFitError(
                "ContinuumModel::fit(): invalid weight/value at anchor " + std::to_string(i) +
                " (w=" + std::to_string(w[i]) + ", y=" + std::to_string(y[i]) + ")");
    }

    /* ---------- weighted Vandermonde system --------------------------- */
    const double span = window_hi - window_lo;
    Matrix A(x.size(), ncoef);
    Vector b(x.size());
    for (Index i = 0; i < x.size(); ++i) {
        const double t = (2.0 * x[i] - (window_lo + window_hi)) / span;
        double p = 1.0;
        for (Index k = 0; k < ncoef; ++k) {
            A(i, k) = w[i] * p;
            p *= t;
        }
        b[i] = w[i] * y[i];
    }

    Eigen::ColPivHouseholderQR<Matrix> qr(A);
    if (qr.rank() < ncoef)
        throw DegenerateFitError(
            "ContinuumModel::fit(): weighted design has rank " + std::to_string(qr.rank()) +
            " < " + std::to_string(ncoef) + " (too few anchors with usable weight)");

    Vector coeffs = qr.solve(b);
    if (!coeffs.allFinite())
        throw DegenerateFitError("ContinuumModel::fit(): non-finite coefficients");

    return ContinuumModel(std::move(coeffs), window_lo, window_hi);
}

} // namespace specclean
