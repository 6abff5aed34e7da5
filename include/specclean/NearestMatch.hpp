#pragma once
#include "Types.hpp"
#include <vector>

namespace specclean {

/**
 * For every continuum wavelength, the index of the closest spectrum
 * wavelength.
 *
 * Both inputs must be strictly increasing (UnsortedInputError otherwise).
 * A single cursor walks the spectrum forward and never resets, so the
 * sweep is O(n + m).  The cursor only moves when the next spectrum
 * wavelength is *strictly* closer: on a tie the lower index wins.
 *
 * The result has one entry per continuum wavelength, in the same order.
 * Several continuum wavelengths may map to the same spectrum index.
 */
IndexVec nearest_indices(const Vector& cont_lambda,
                         const Vector& spec_lambda);

/* matched spectrum wavelengths, one per continuum wavelength */
Vector nearest_values(const Vector& cont_lambda,
                      const Vector& spec_lambda);

/* 1 at every matched spectrum index, size == spec_lambda.size() */
std::vector<int> nearest_mask(const Vector& cont_lambda,
                              const Vector& spec_lambda);

} // namespace specclean
