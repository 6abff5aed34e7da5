#pragma once
#include "Types.hpp"

namespace specclean {

/*
 * Low-order polynomial continuum
 *
 *     c(λ) = Σ_k  a_k · t^k ,     t = (2λ - (w0 + w1)) / (w1 - w0)
 *
 * i.e. the abscissa is mapped from the fit window [w0, w1] onto [-1, 1]
 * before the power basis is applied.  The same window is used for fitting
 * and evaluation.
 */
class ContinuumModel {
public:
    ContinuumModel(Vector coeffs, double window_lo, double window_hi);

    /*  Weighted least squares: minimises  Σ (w_i · (y_i - c(x_i)))².
     *  Throws DegenerateFitError if fewer than degree+1 distinct x, a
     *  weight is not finite / negative, or the design is rank deficient.  */
    static ContinuumModel fit(const Vector& x,
                              const Vector& y,
                              const Vector& w,
                              int           degree,
                              double        window_lo,
                              double        window_hi);

    double operator()(double lambda) const;
    Vector evaluate(const Vector& lambda) const;

    const Vector& coefficients() const { return coeffs_; }
    int    degree()    const { return static_cast<int>(coeffs_.size()) - 1; }
    double window_lo() const { return w0_; }
    double window_hi() const { return w1_; }

private:
    double map_(double lambda) const;

    Vector coeffs_;          // a_0 … a_deg in the mapped variable
    double w0_, w1_;
};

} // namespace specclean
