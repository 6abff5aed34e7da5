#pragma once
#include "Types.hpp"
#include "BadPixelSpec.hpp"

namespace specclean {

/**
 * Return a copy of `sigma` in which every pixel whose bitmask has at least
 * one significant bit set is replaced by kSentinelError.  All other pixels
 * pass through unchanged.
 *
 * Throws ShapeMismatchError if sigma and bitmask differ in length.
 */
Vector inflate_errors(const Vector&       sigma,
                      const Bitmask&      bitmask,
                      const BadPixelSpec& spec);

/* same, but rewrites sigma in place */
void inflate_errors_in_place(Vector&             sigma,
                             const Bitmask&      bitmask,
                             const BadPixelSpec& spec);

// 1 == pixel flagged bad, 0 == usable
std::vector<int> bad_pixel_flags(const Bitmask& bitmask, const BadPixelSpec& spec);

std::size_t count_bad_pixels(const Bitmask& bitmask, const BadPixelSpec& spec);

} // namespace specclean
