#pragma once
#include "Types.hpp"

namespace specclean {

/*  λ_i = 10^(start + delta·i),   i = 0 … npix-1
 *  start / delta are the log10 header values (CRVAL1 / CDELT1).          */
Vector log_wavelength_grid(double start,
                           double delta,
                           Index  npix = kApogeeNpix);

// apStar: CRVAL1 = 4.179, CDELT1 = 6e-6, 8575 pixels
Vector apogee_wavelength_grid();

// throws UnsortedInputError unless lambda is strictly increasing
void require_strictly_increasing(const Vector& lambda, const char* who);

} // namespace specclean
