#include "specclean/NearestMatch.hpp"
#include "specclean/Errors.hpp"
#include "specclean/WavelengthGrid.hpp"
#include <cmath>       // std::abs

namespace specclean {

/* ---------------------------------------------------------------------- */
IndexVec nearest_indices(const Vector& cont_lambda,
                         const Vector& spec_lambda)
{
    const Index n_cont = cont_lambda.size();
    const Index n_spec = spec_lambda.size();

    IndexVec out;
    if (n_cont == 0) return out;

    if (n_spec == 0)
        throw EmptyIntervalError(
            "nearest_indices(): " + std::to_string(n_cont) +
            " continuum wavelengths but the spectrum has no pixels");

    require_strictly_increasing(cont_lambda, "nearest_indices(continuum)");
    require_strictly_increasing(spec_lambda, "nearest_indices(spectrum)");

    out.reserve(static_cast<std::size_t>(n_cont));

    // -------- single forward sweep; j never moves backwards ---------------
    Index j = 0;
    for (Index i = 0; i < n_cont; ++i) {
        const double c = cont_lambda[i];
        while (j + 1 < n_spec &&
               std::abs(spec_lambda[j + 1] - c) < std::abs(spec_lambda[j] - c))
            ++j;
        out.push_back(j);
    }
    return out;
}

/* ---------------------------------------------------------------------- */
Vector nearest_values(const Vector& cont_lambda,
                      const Vector& spec_lambda)
{
    const IndexVec idx = nearest_indices(cont_lambda, spec_lambda);

    Vector out(static_cast<Index>(idx.size()));
    for (std::size_t k = 0; k < idx.size(); ++k)
        out[static_cast<Index>(k)] = spec_lambda[idx[k]];
    return out;
}

/* ---------------------------------------------------------------------- */
std::vector<int> nearest_mask(const Vector& cont_lambda,
                              const Vector& spec_lambda)
{
    std::vector<int> mask(static_cast<std::size_t>(spec_lambda.size()), 0);
    for (Index j : nearest_indices(cont_lambda, spec_lambda))
        mask[static_cast<std::size_t>(j)] = 1;
    return mask;
}

} // namespace specclean
