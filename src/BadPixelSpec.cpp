#include "specclean/BadPixelSpec.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace specclean {

namespace {

const std::array<std::string, BadPixelSpec::kNumBits> kPixmaskNames = {
    "BADPIX",       "CRPIX",        "SATPIX",       "UNFIXABLE",
    "BADDARK",      "BADFLAT",      "BADERR",       "NOSKY",
    "LITTROW_GHOST","PERSIST_HIGH", "PERSIST_MED",  "PERSIST_LOW",
    "SIG_SKYLINE",  "SIG_TELLURIC", "NOT_ENOUGH_PSF"
};

std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // unnamed namespace

/* ---------------------------------------------------------------------- */
BadPixelSpec::BadPixelSpec(const std::vector<int>& bits)
{
    for (int b : bits) set_bit(b);
}

BadPixelSpec::BadPixelSpec(const std::map<int, bool>& significance)
{
    for (const auto& kv : significance) {
        if (kv.first < 0 || kv.first >= kNumBits)
            throw std::invalid_argument("BadPixelSpec: bit " + std::to_string(kv.first) +
                                        " outside 0.." + std::to_string(kNumBits - 1));
        if (kv.second) set_bit(kv.first);
    }
}

BadPixelSpec BadPixelSpec::from_mask(std::uint32_t mask)
{
    if (mask >> kNumBits)
        throw std::invalid_argument("BadPixelSpec::from_mask(): mask " + std::to_string(mask) +
                                    " sets bits above " + std::to_string(kNumBits - 1));
    BadPixelSpec spec;
    for (int b = 0; b < kNumBits; ++b)
        if (mask & (1u << b)) spec.set_bit(b);
    return spec;
}

BadPixelSpec BadPixelSpec::from_names(const std::vector<std::string>& names)
{
    BadPixelSpec spec;
    for (const auto& n : names) spec.set_bit(pixmask_bit_from_name(n));
    return spec;
}

BadPixelSpec BadPixelSpec::apogee_default()
{
    return BadPixelSpec(std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 12});
}

bool BadPixelSpec::is_significant(int bit) const
{
    if (bit < 0 || bit >= kNumBits) return false;
    return bits_.test(static_cast<std::size_t>(bit));
}

std::vector<int> BadPixelSpec::bits() const
{
    std::vector<int> out;
    for (int b = 0; b < kNumBits; ++b)
        if (bits_.test(static_cast<std::size_t>(b))) out.push_back(b);
    return out;
}

void BadPixelSpec::set_bit(int bit)
{
    if (bit < 0 || bit >= kNumBits)
        throw std::invalid_argument("BadPixelSpec: bit " + std::to_string(bit) +
                                    " outside 0.." + std::to_string(kNumBits - 1));
    bits_.set(static_cast<std::size_t>(bit));
    mask_ |= (1u << bit);
}

/* ---------------------------------------------------------------------- */
const std::string& pixmask_bit_name(int bit)
{
    if (bit < 0 || bit >= BadPixelSpec::kNumBits)
        throw std::invalid_argument("pixmask_bit_name(): no APOGEE_PIXMASK bit " +
                                    std::to_string(bit));
    return kPixmaskNames[static_cast<std::size_t>(bit)];
}

int pixmask_bit_from_name(const std::string& name)
{
    const std::string key = to_upper(name);
    for (std::size_t b = 0; b < kPixmaskNames.size(); ++b)
        if (kPixmaskNames[b] == key) return static_cast<int>(b);
    throw std::invalid_argument("pixmask_bit_from_name(): unknown APOGEE_PIXMASK bit '" +
                                name + "'");
}

} // namespace specclean
