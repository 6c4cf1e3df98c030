#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace snapfreeze {

struct MountTarget {
    std::string mountPoint;
    std::string device;
    FilesystemKind kind = FilesystemKind::Ext4;

    bool operator==(const MountTarget &other) const
    {
        return mountPoint == other.mountPoint;
    }
};

struct Tag {
    std::string key;
    std::string value;

    bool operator==(const Tag &other) const
    {
        return key == other.key && value == other.value;
    }
};

// Built once per run, before anything is frozen. volumeId is filled per call.
struct SnapshotRequest {
    std::string volumeId;
    std::string description;
    std::vector<Tag> tags;
};

struct SnapshotResult {
    std::string volumeId;
    bool success = false;
    std::string snapshotId;
    std::string errorDetail;

    static SnapshotResult succeeded(const std::string &volumeId,
                                    const std::string &snapshotId)
    {
        SnapshotResult result;
        result.volumeId = volumeId;
        result.success = true;
        result.snapshotId = snapshotId;
        return result;
    }

    static SnapshotResult failed(const std::string &volumeId,
                                 const std::string &errorDetail)
    {
        SnapshotResult result;
        result.volumeId = volumeId;
        result.success = false;
        result.errorDetail = errorDetail;
        return result;
    }
};

struct RunReport {
    RunState state = RunState::Idle;
    std::string correlationId;
    std::string instanceId;
    std::string region;
    std::vector<std::string> volumes;
    std::vector<MountTarget> targets;
    std::vector<MountTarget> frozenTargets;
    // Targets that could not be thawed; non-empty only on the worst-case path.
    std::vector<MountTarget> stillFrozen;
    std::vector<SnapshotResult> results;

    ErrorKind errorKind = ErrorKind::None;
    std::string errorMessage;
    std::optional<int> interruptSignal;
    int recoveryCount = 0;
    int exitCode = 0;

    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    std::chrono::milliseconds frozenDuration{0};

    int succeededCount() const
    {
        int count = 0;
        for (const auto &result : results) {
            if (result.success) {
                ++count;
            }
        }
        return count;
    }

    int failedCount() const
    {
        return static_cast<int>(results.size()) - succeededCount();
    }
};

} // namespace snapfreeze
