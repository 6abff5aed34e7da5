#pragma once
#include "Types.hpp"
#include <string>
#include <vector>

namespace specclean {

// open wavelength window  lo < λ < hi   (Å); infinite bounds allowed, NaN is not
struct Interval {
    double lo;
    double hi;

    Interval(double lo_, double hi_);

    bool contains(double x) const { return lo < x && x < hi; }
    std::string str() const;
};

/**
 * Indices i with  lo < lambda[i] < hi, ascending.  lambda must be strictly
 * increasing (UnsortedInputError otherwise); the bounds are found with two
 * binary searches.  An empty result is returned as-is.
 */
IndexVec select_interval(const Vector& lambda, const Interval& interval);

/* gather helpers: out[k] = values[idx[k]] */
Vector           take(const Vector& values, const IndexVec& idx);
std::vector<int> take(const std::vector<int>& values, const IndexVec& idx);

} // namespace specclean
