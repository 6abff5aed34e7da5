#pragma once
#include <bitset>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace specclean {

/*
 * Which APOGEE_PIXMASK bits make a pixel unusable.
 *
 *   bit  name              bit  name
 *    0   BADPIX             8   LITTROW_GHOST
 *    1   CRPIX              9   PERSIST_HIGH
 *    2   SATPIX            10   PERSIST_MED
 *    3   UNFIXABLE         11   PERSIST_LOW
 *    4   BADDARK           12   SIG_SKYLINE
 *    5   BADFLAT           13   SIG_TELLURIC
 *    6   BADERR            14   NOT_ENOUGH_PSF
 *    7   NOSKY
 *
 * The set is immutable once built; combined_mask() is the OR of 2^bit over
 * every significant bit and is what the per-pixel test uses.
 */
class BadPixelSpec {
public:
    static constexpr int kNumBits = 15;

    BadPixelSpec() = default;                                   // nothing flagged
    explicit BadPixelSpec(const std::vector<int>& bits);
    explicit BadPixelSpec(const std::map<int, bool>& significance);

    static BadPixelSpec from_mask(std::uint32_t mask);
    static BadPixelSpec from_names(const std::vector<std::string>& names);

    // bits {0-7, 12}, mask 4351
    static BadPixelSpec apogee_default();

    bool          is_significant(int bit) const;
    std::uint32_t combined_mask() const { return mask_; }
    bool          empty() const { return bits_.none(); }
    std::size_t   count() const { return bits_.count(); }

    std::vector<int> bits() const;

private:
    void set_bit(int bit);

    std::bitset<kNumBits> bits_;
    std::uint32_t         mask_ = 0;
};

/* APOGEE_PIXMASK bit names ------------------------------------------------ */
const std::string& pixmask_bit_name(int bit);
int                pixmask_bit_from_name(const std::string& name);

} // namespace specclean
