#pragma once
#include "Types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace specclean {

/*
 * Persisted table of (wavelength, is_continuum) pairs.  Loaded once and
 * shared read-only across all spectra of a run.  Rows are kept sorted by
 * wavelength.
 */
class ContinuumReference {
public:
    ContinuumReference() = default;
    ContinuumReference(Vector wavelength, std::vector<int> is_continuum,
                       std::string source = "<memory>");

    const Vector&           wavelength()   const { return wavelength_; }
    const std::vector<int>& is_continuum() const { return is_continuum_; }
    const std::string&      source()       const { return source_; }
    Index                   size()         const { return wavelength_.size(); }

    // flagged subset, ascending -- the fit anchors
    const Vector& continuum_wavelengths() const { return cont_wavelength_; }

private:
    Vector           wavelength_;
    std::vector<int> is_continuum_;
    Vector           cont_wavelength_;
    std::string      source_;
};

using ReferenceLoader = std::function<ContinuumReference(const std::string&)>;

/* every loader throws MissingReferenceError when the resource cannot be read */
ContinuumReference load_reference_ascii(const std::string& path);   // "wavelength is_continuum"
ContinuumReference load_reference_json (const std::string& path);   // {"wavelength":[…],"is_continuum":[…]}
ContinuumReference load_reference_fits (const std::string& path);   // binary table, HDU 1

// format: "ascii", "json", "fits" or "auto" (by extension)
ContinuumReference load_reference(const std::string& path,
                                  const std::string& format = "auto");

} // namespace specclean
