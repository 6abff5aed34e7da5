#pragma once
#include <stdexcept>
#include <string>

namespace specclean {

/* --------------------------------------------------------------------- *
 *  Exception taxonomy of the cleaning pipeline.                          *
 *                                                                        *
 *  Every error is thrown next to the violated precondition and carries  *
 *  the lengths / bounds / counts needed to diagnose it.                  *
 * --------------------------------------------------------------------- */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// aligned arrays of unequal length
class ShapeMismatchError : public Error {
public:
    using Error::Error;
};

// wavelength sequence not strictly increasing
class UnsortedInputError : public Error {
public:
    using Error::Error;
};

// an interval selected zero points
class EmptyIntervalError : public Error {
public:
    using Error::Error;
};

// too few anchors, rank-deficient design or zero continuum
class DegenerateFitError : public Error {
public:
    using Error::Error;
};

// continuum reference table could not be loaded
class MissingReferenceError : public Error {
public:
    using Error::Error;
};

} // namespace specclean
