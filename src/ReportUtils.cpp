#include "specclean/ReportUtils.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace specclean {

void write_normalized_csv(std::ostream& os, const NormalizedSpectrum& ns)
{
    os << "lambda,flux,sigma,continuum,anchor\n";
    const Index N = ns.size();
    for (Index i = 0; i < N; ++i) {
        const Index src = ns.source_index[static_cast<std::size_t>(i)];
        const bool  anchor = std::binary_search(ns.anchor_index.begin(),
                                                ns.anchor_index.end(), src);
        os << std::setprecision(10)
           << ns.lambda[i]    << ','
           << ns.flux[i]      << ','
           << ns.sigma[i]     << ','
           << ns.continuum[i] << ','
           << int(anchor)     << '\n';
    }
}

void write_normalized_csv(const std::string& path, const NormalizedSpectrum& ns)
{
    std::ofstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot write: " + path);
    write_normalized_csv(f, ns);
    if (!f)
        throw std::runtime_error("Error while writing: " + path);
}

std::string summary_line(const std::string& name, const NormalizedSpectrum& ns)
{
    std::ostringstream s;
    s << name << ": " << ns.size() << " pixels";
    if (ns.size() > 0)
        s << " in [" << std::fixed << std::setprecision(2) << ns.lambda[0] << ", "
          << ns.lambda[ns.size() - 1] << "] A";
    s << ", " << ns.anchor_index.size() << " anchors, "
      << ns.n_bad_pixels << " flagged";
    return s.str();
}

} // namespace specclean
