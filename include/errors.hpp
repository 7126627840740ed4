#pragma once

#include <stdexcept>

/// L, a, M and the lattice type fail a divisibility or minimal-length rule.
/// Raised before any numeric work.
struct IncompatibleLatticeError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// No integer shear maps the non-separable lattice onto a rectangular one
/// for the given length. Choose L from dgt_length() instead.
struct NoShearFoundError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// An array argument does not have the shape implied by L, a, M, R and W.
struct ShapeMismatchError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

/// The shear index map is not an exact bijection onto the non-separable
/// lattice. Indicates a defect, never a user error.
struct LatticeIndexingError : std::logic_error {
    using std::logic_error::logic_error;
};
