#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace snapfreeze {

// Opaque provider call: create-snapshot(volumeId, description, region, tags).
// Implementations report failure through the result, never by throwing,
// except InterruptedError when a pending signal cut the call short.
class SnapshotApi
{
public:
    virtual ~SnapshotApi() = default;

    virtual SnapshotResult createSnapshot(const SnapshotRequest &request,
                                          const std::string &region) = 0;
};

/**
 * Best-effort fan-out of one create-snapshot call per volume.
 *
 * A failed volume is recorded and the next one is still attempted; the result
 * vector always has one entry per dispatched volume, in volume order.
 * Interruption is the only thing that stops the loop early.
 */
class SnapshotRequester
{
public:
    explicit SnapshotRequester(SnapshotApi &api);

    std::vector<SnapshotResult> requestSnapshots(const std::vector<std::string> &volumes,
                                                 const SnapshotRequest &request,
                                                 const std::string &region);

    // Results gathered so far; survives an interrupted requestSnapshots().
    const std::vector<SnapshotResult> &collected() const { return m_collected; }

private:
    SnapshotApi &m_api;
    std::vector<SnapshotResult> m_collected;
};

} // namespace snapfreeze
