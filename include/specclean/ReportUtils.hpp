#pragma once
#include "ContinuumNormalizer.hpp"
#include <iosfwd>
#include <string>

namespace specclean {

/* --------------------------------------------------------------------- */
/*   lambda,flux,sigma,continuum,anchor     one row per output pixel     */
/* --------------------------------------------------------------------- */
void write_normalized_csv(std::ostream& os, const NormalizedSpectrum& ns);
void write_normalized_csv(const std::string& path, const NormalizedSpectrum& ns);

// one-line summary for the console
std::string summary_line(const std::string& name, const NormalizedSpectrum& ns);

} // namespace specclean
