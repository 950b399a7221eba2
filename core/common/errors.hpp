#pragma once

#include <stdexcept>
#include <string>

namespace dconf {

// ─── Error kinds ───────────────────────────────────────────────
// Everything the library throws derives from one of the standard
// exception families so callers can catch either the specific kind
// or the std:: base.

/// Caller-supplied arguments are unusable (empty alphas or labels,
/// profile size larger than the label set, malformed hierarchy...).
/// Raised before any graph access whenever it can be detected up front.
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what)
        : std::invalid_argument(what) {}
};

/// An internal precondition did not hold (e.g. scoring an empty shell).
class PreconditionViolation : public std::logic_error {
public:
    explicit PreconditionViolation(const std::string& what)
        : std::logic_error(what) {}
};

/// The snapshot provider or the path oracle handed back data that does
/// not fit together: a distance for a node outside the snapshot, a node
/// without a requested label, a negative distance.
class UpstreamDataError : public std::runtime_error {
public:
    explicit UpstreamDataError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace dconf
