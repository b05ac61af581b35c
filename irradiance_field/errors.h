#pragma once

#include <stdexcept>
#include <string>

// Precondition failures reported by the solver.
// All of them are thrown synchronously; the solver never retries.

namespace irradiance {

class SolverError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Non-positive or non-finite rectangle dimension, non-finite placement.
class InvalidGeometry : public SolverError {
public:
    using SolverError::SolverError;
};

// Receiver accuracy < 2 or malformed source sampling policy.
class InvalidGrid : public SolverError {
public:
    using SolverError::SolverError;
};

// Standoff distance <= 0 or non-finite.
class InvalidDistance : public SolverError {
public:
    using SolverError::SolverError;
};

// Negative or non-finite source power.
class InvalidPower : public SolverError {
public:
    using SolverError::SolverError;
};

// Calibration divisor <= 0, negative correction constants.
class InvalidCalibration : public SolverError {
public:
    using SolverError::SolverError;
};

} // namespace irradiance
