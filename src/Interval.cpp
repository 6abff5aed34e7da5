#include "specclean/Interval.hpp"
#include "specclean/Errors.hpp"
#include "specclean/WavelengthGrid.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace specclean {

Interval::Interval(double lo_, double hi_)
    : lo(lo_), hi(hi_)
{
    if (std::isnan(lo) || std::isnan(hi))
        throw std::invalid_argument("Interval: NaN bound in " + str());
}

std::string Interval::str() const
{
    std::ostringstream s;
    s << '(' << lo << ", " << hi << ')';
    return s.str();
}

/* ---------------------------------------------------------------------- */
IndexVec select_interval(const Vector& lambda, const Interval& interval)
{
    require_strictly_increasing(lambda, "select_interval()");

    const double* first = lambda.data();
    const double* last  = lambda.data() + lambda.size();

    // first λ > lo   …   first λ >= hi
    const double* b = std::upper_bound(first, last, interval.lo);
    const double* e = std::lower_bound(b, last, interval.hi);

    // lo >= hi selects nothing
    IndexVec idx;
    if (!(interval.lo < interval.hi)) return idx;
    idx.reserve(static_cast<std::size_t>(e - b));
    for (const double* p = b; p != e; ++p)
        idx.push_back(static_cast<Index>(p - first));
    return idx;
}

/* ---------------------------------------------------------------------- */
Vector take(const Vector& values, const IndexVec& idx)
{
    Vector out(static_cast<Index>(idx.size()));
    for (std::size_t k = 0; k < idx.size(); ++k) {
        if (idx[k] < 0 || idx[k] >= values.size())
            throw ShapeMismatchError("take(): index " + std::to_string(idx[k]) +
                                     " out of range for array of length " +
                                     std::to_string(values.size()));
        out[static_cast<Index>(k)] = values[idx[k]];
    }
    return out;
}

std::vector<int> take(const std::vector<int>& values, const IndexVec& idx)
{
    std::vector<int> out(idx.size());
    for (std::size_t k = 0; k < idx.size(); ++k) {
        if (idx[k] < 0 || static_cast<std::size_t>(idx[k]) >= values.size())
            throw ShapeMismatchError("take(): index " + std::to_string(idx[k]) +
                                     " out of range for array of length " +
                                     std::to_string(values.size()));
        out[k] = values[static_cast<std::size_t>(idx[k])];
    }
    return out;
}

} // namespace specclean
