#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace snapfreeze {

class FreezeController;
class InstanceContext;
class SnapshotApi;

/**
 * CriticalSection drives one crash-consistent snapshot run:
 *
 *   Idle -> Syncing -> Freezing -> Snapshotting -> Unfreezing -> Done
 *
 * Instance context is resolved before anything is frozen. Any error or
 * pending interruption while Freezing or Snapshotting lands in a one-shot
 * recovery handler that thaws every target the FreezeController still holds,
 * and the run ends in FailedRecovered. The normal-path unfreeze disarms the
 * handler, so a thaw is never retried.
 *
 * run() never throws; the outcome, including the process exit code, is in
 * the returned RunReport. Per-volume snapshot failures do not affect the exit
 * code.
 */
class CriticalSection
{
public:
    using SyncFunction = std::function<void()>;
    using EnumerateFunction = std::function<std::vector<MountTarget>()>;

    CriticalSection(InstanceContext &context,
                    FreezeController &freezer,
                    SnapshotApi &api,
                    EnumerateFunction enumerate,
                    SyncFunction sync = SyncFunction());

    RunReport run(const SnapshotRequest &request);

    RunState state() const { return m_state; }

private:
    friend class RecoveryGuard;

    void setState(RunState state);

    // Thaws the full known FreezeState at most once per run.
    void recoverOnce(RunReport &report, const std::string &trigger);

    void fail(RunReport &report, ErrorKind kind, const std::string &message,
              int exitCode, int signalNumber);

    InstanceContext &m_context;
    FreezeController &m_freezer;
    SnapshotApi &m_api;
    EnumerateFunction m_enumerate;
    SyncFunction m_sync;

    RunState m_state = RunState::Idle;
    bool m_recoveryFired = false;
    bool m_unfreezeStarted = false;
    std::chrono::steady_clock::time_point m_frozenAt;
};

} // namespace snapfreeze
