#include "specclean/ErrorInflation.hpp"
#include "specclean/Errors.hpp"
#include <string>

namespace specclean {

static inline bool is_bad(int flags, std::uint32_t mask)
{
    return (static_cast<std::uint32_t>(flags) & mask) != 0;
}

void inflate_errors_in_place(Vector&             sigma,
                             const Bitmask&      bitmask,
                             const BadPixelSpec& spec)
{
    if (static_cast<std::size_t>(sigma.size()) != bitmask.size())
        throw ShapeMismatchError(
            "inflate_errors(): error array has " + std::to_string(sigma.size()) +
            " pixels but bitmask has " + std::to_string(bitmask.size()));

    const std::uint32_t mask = spec.combined_mask();
    if (mask == 0) return;                    // nothing can ever be flagged

    for (Index i = 0; i < sigma.size(); ++i)
        if (is_bad(bitmask[static_cast<std::size_t>(i)], mask))
            sigma[i] = kSentinelError;
}

Vector inflate_errors(const Vector&       sigma,
                      const Bitmask&      bitmask,
                      const BadPixelSpec& spec)
{
    Vector out = sigma;
    inflate_errors_in_place(out, bitmask, spec);
    return out;
}

std::vector<int> bad_pixel_flags(const Bitmask& bitmask, const BadPixelSpec& spec)
{
    const std::uint32_t mask = spec.combined_mask();
    std::vector<int> flags(bitmask.size(), 0);
    for (std::size_t i = 0; i < bitmask.size(); ++i)
        flags[i] = is_bad(bitmask[i], mask) ? 1 : 0;
    return flags;
}

std::size_t count_bad_pixels(const Bitmask& bitmask, const BadPixelSpec& spec)
{
    const std::uint32_t mask = spec.combined_mask();
    std::size_t n = 0;
    for (int b : bitmask)
        if (is_bad(b, mask)) ++n;
    return n;
}

} // namespace specclean
