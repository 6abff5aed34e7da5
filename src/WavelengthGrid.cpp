#include "specclean/WavelengthGrid.hpp"
#include "specclean/Errors.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace specclean {

Vector log_wavelength_grid(double start, double delta, Index npix)
{
    if (npix <= 0)
        throw std::invalid_argument("log_wavelength_grid(): npix must be positive");
    if (!(delta > 0.0) || !std::isfinite(start))
        throw std::invalid_argument("log_wavelength_grid(): need finite start and delta > 0");

    Vector grid(npix);
    for (Index i = 0; i < npix; ++i)
        grid[i] = std::pow(10.0, start + delta * static_cast<double>(i));
    return grid;
}

Vector apogee_wavelength_grid()
{
    return log_wavelength_grid(4.179, 6e-6, kApogeeNpix);
}

void require_strictly_increasing(const Vector& lambda, const char* who)
{
    for (Index i = 1; i < lambda.size(); ++i) {
        if (!(lambda[i] > lambda[i - 1]))
            throw UnsortedInputError(
                std::string(who) + ": wavelengths not strictly increasing at index " +
                std::to_string(i) + " (" + std::to_string(lambda[i - 1]) + " -> " +
                std::to_string(lambda[i]) + ")");
    }
}

} // namespace specclean
