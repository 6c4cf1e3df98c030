#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace snapfreeze {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toKindString(FilesystemKind kind)
{
    switch (kind) {
    case FilesystemKind::Ext2:
        return "ext2";
    case FilesystemKind::Ext3:
        return "ext3";
    case FilesystemKind::Ext4:
        return "ext4";
    case FilesystemKind::Xfs:
        return "xfs";
    case FilesystemKind::Btrfs:
        return "btrfs";
    case FilesystemKind::Jfs:
        return "jfs";
    case FilesystemKind::Reiserfs:
        return "reiserfs";
    case FilesystemKind::F2fs:
        return "f2fs";
    case FilesystemKind::Nilfs2:
        return "nilfs2";
    case FilesystemKind::Gfs2:
        return "gfs2";
    }
    return "ext4";
}

// Returns nullopt for filesystem types that cannot be frozen.
inline std::optional<FilesystemKind> parseKindString(const std::string &value)
{
    if (value == "ext2") {
        return FilesystemKind::Ext2;
    }
    if (value == "ext3") {
        return FilesystemKind::Ext3;
    }
    if (value == "ext4") {
        return FilesystemKind::Ext4;
    }
    if (value == "xfs") {
        return FilesystemKind::Xfs;
    }
    if (value == "btrfs") {
        return FilesystemKind::Btrfs;
    }
    if (value == "jfs") {
        return FilesystemKind::Jfs;
    }
    if (value == "reiserfs") {
        return FilesystemKind::Reiserfs;
    }
    if (value == "f2fs") {
        return FilesystemKind::F2fs;
    }
    if (value == "nilfs2") {
        return FilesystemKind::Nilfs2;
    }
    if (value == "gfs2") {
        return FilesystemKind::Gfs2;
    }
    return std::nullopt;
}

inline std::string toStateString(RunState state)
{
    switch (state) {
    case RunState::Idle:
        return "idle";
    case RunState::Syncing:
        return "syncing";
    case RunState::Freezing:
        return "freezing";
    case RunState::Snapshotting:
        return "snapshotting";
    case RunState::Unfreezing:
        return "unfreezing";
    case RunState::Done:
        return "done";
    case RunState::Failed:
        return "failed";
    case RunState::FailedRecovered:
        return "failed_recovered";
    }
    return "idle";
}

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Config:
        return "config";
    case ErrorKind::Context:
        return "context";
    case ErrorKind::Enumeration:
        return "enumeration";
    case ErrorKind::Lock:
        return "lock";
    case ErrorKind::Freeze:
        return "freeze";
    case ErrorKind::Unfreeze:
        return "unfreeze";
    case ErrorKind::Interrupted:
        return "interrupted";
    case ErrorKind::Internal:
        return "internal";
    }
    return "internal";
}

inline void to_json(nlohmann::json &j, const FilesystemKind &kind)
{
    j = toKindString(kind);
}

inline void to_json(nlohmann::json &j, const RunState &state)
{
    j = toStateString(state);
}

inline void to_json(nlohmann::json &j, const ErrorKind &kind)
{
    j = toErrorKindString(kind);
}

inline void to_json(nlohmann::json &j, const MountTarget &target)
{
    j = nlohmann::json{
        {"mountPoint", target.mountPoint},
        {"device", target.device},
        {"kind", target.kind}
    };
}

inline void to_json(nlohmann::json &j, const Tag &tag)
{
    j = nlohmann::json{{"Key", tag.key}, {"Value", tag.value}};
}

inline void from_json(const nlohmann::json &j, Tag &tag)
{
    tag.key = j.value("Key", "");
    tag.value = j.value("Value", "");
}

inline void to_json(nlohmann::json &j, const SnapshotResult &result)
{
    j = nlohmann::json{
        {"volumeId", result.volumeId},
        {"outcome", result.success ? "success" : "failure"}
    };
    if (result.success) {
        j["snapshotId"] = result.snapshotId;
    } else {
        j["error"] = result.errorDetail;
    }
}

inline void to_json(nlohmann::json &j, const RunReport &report)
{
    j = nlohmann::json{
        {"state", report.state},
        {"corr", report.correlationId},
        {"instanceId", report.instanceId},
        {"region", report.region},
        {"volumes", report.volumes},
        {"targets", report.targets},
        {"frozenTargets", report.frozenTargets},
        {"stillFrozen", report.stillFrozen},
        {"results", report.results},
        {"succeeded", report.succeededCount()},
        {"failed", report.failedCount()},
        {"error", nlohmann::json{
            {"kind", report.errorKind},
            {"message", report.errorMessage}
        }},
        {"recoveries", report.recoveryCount},
        {"exitCode", report.exitCode},
        {"startedAt", toIso8601Utc(report.startedAt)},
        {"finishedAt", toIso8601Utc(report.finishedAt)},
        {"frozenMs", report.frozenDuration.count()}
    };
    if (report.interruptSignal.has_value()) {
        j["interruptSignal"] = *report.interruptSignal;
    } else {
        j["interruptSignal"] = nullptr;
    }
}

} // namespace snapfreeze
