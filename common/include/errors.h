#ifndef __ROWAN_ERRORS__
#define __ROWAN_ERRORS__

#include <stdexcept>
#include <string>

namespace Rowan {

// Base for every error raised by the numeric core
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) { }
};

// A filter specification that can not be designed (bad band ordering,
// edge count / band type mismatch, non-positive ripple or attenuation, ...)
class SpecificationError : public Error {
public:
    explicit SpecificationError(const std::string& what) : Error(what) { }
};

// The order solver or the coefficient synthesis did not produce a finite result
class NumericDivergenceError : public Error {
public:
    explicit NumericDivergenceError(const std::string& what) : Error(what) { }
};

// Caller broke an API contract (window length < 1, parameter arity, ...)
class PreconditionError : public Error {
public:
    explicit PreconditionError(const std::string& what) : Error(what) { }
};

}

#endif
