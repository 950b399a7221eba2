#pragma once

#include "graph/graph.hpp"

#include <cstdint>
#include <vector>

namespace dconf {

/// Materializes the static view of a dynamic graph over a time range.
/// Implementations return every interaction whose activity intersects
/// the closed range [t_from, t_to], together with the incident nodes and
/// their labels.
class SnapshotProvider {
public:
    virtual ~SnapshotProvider() = default;

    virtual Graph timeSlice(int64_t t_from, int64_t t_to) const = 0;
};

/// Exposes the ordered temporal ids at which a dynamic graph changes.
/// Sliding windows start at these ids.
class TemporalIndex {
public:
    virtual ~TemporalIndex() = default;

    /// Sorted ascending, without duplicates.
    virtual std::vector<int64_t> temporalSnapshotIds() const = 0;
};

} // namespace dconf
