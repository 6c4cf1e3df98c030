#include "core/critical_section.hpp"

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <QDebug>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/interruption.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/freeze_controller.hpp"
#include "core/snapshot_requester.hpp"
#include "provider/instance_context.hpp"

namespace snapfreeze {

// Runs recovery when the frozen window is left by unwinding instead of by
// the normal-path unfreeze.
class RecoveryGuard
{
public:
    RecoveryGuard(CriticalSection &section, RunReport &report)
        : m_section(section)
        , m_report(report)
    {
    }

    ~RecoveryGuard()
    {
        if (m_section.m_unfreezeStarted) {
            return;
        }
        try {
            m_section.recoverOnce(m_report, "abnormal_exit");
        } catch (const std::exception &ex) {
            qCritical() << "snapfreeze: recovery failed:" << ex.what();
        }
    }

    RecoveryGuard(const RecoveryGuard &) = delete;
    RecoveryGuard &operator=(const RecoveryGuard &) = delete;

private:
    CriticalSection &m_section;
    RunReport &m_report;
};

namespace {

// Keeps file log output in memory while targets may be frozen. Declared
// ahead of the RecoveryGuard so the release happens after the recovery thaw.
class HeldLogOutput
{
public:
    explicit HeldLogOutput(const FreezeController &freezer)
        : m_freezer(freezer)
    {
        logging::holdFileOutput();
    }

    ~HeldLogOutput()
    {
        std::vector<std::string> stillFrozen;
        for (const auto &target : m_freezer.frozenTargets()) {
            stillFrozen.push_back(target.mountPoint);
        }
        logging::releaseFileOutput(stillFrozen);
    }

    HeldLogOutput(const HeldLogOutput &) = delete;
    HeldLogOutput &operator=(const HeldLogOutput &) = delete;

private:
    const FreezeController &m_freezer;
};

void flushFilesystems()
{
    ::sync();
}

std::string describeTargets(const std::vector<MountTarget> &targets)
{
    std::string text;
    for (const auto &target : targets) {
        if (!text.empty()) {
            text += ", ";
        }
        text += target.mountPoint;
    }
    return text;
}

} // namespace

CriticalSection::CriticalSection(InstanceContext &context,
                                 FreezeController &freezer,
                                 SnapshotApi &api,
                                 EnumerateFunction enumerate,
                                 SyncFunction sync)
    : m_context(context)
    , m_freezer(freezer)
    , m_api(api)
    , m_enumerate(std::move(enumerate))
    , m_sync(sync ? std::move(sync) : SyncFunction(flushFilesystems))
{
}

void CriticalSection::setState(RunState state)
{
    SFLOG_DEBUG(QStringLiteral("CriticalSection"),
                QStringLiteral("setState"),
                QStringLiteral("state_change"),
                QStringLiteral("run_progress"),
                QStringLiteral("state_machine"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"from", m_state}, {"to", state}}));
    m_state = state;
}

void CriticalSection::recoverOnce(RunReport &report, const std::string &trigger)
{
    if (m_recoveryFired) {
        return;
    }
    m_recoveryFired = true;
    report.recoveryCount++;

    const std::vector<MountTarget> known = m_freezer.frozenTargets();
    SFLOG_WARN(QStringLiteral("CriticalSection"),
               QStringLiteral("recoverOnce"),
               QStringLiteral("recovery_unfreeze"),
               QString::fromStdString(trigger),
               QStringLiteral("unfreeze_all_known"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"state", m_state}, {"targets", known}}));

    const UnfreezeOutcome outcome = m_freezer.unfreezeAll();
    report.frozenDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_frozenAt);
    if (!outcome.ok()) {
        report.stillFrozen = outcome.failedTargets();
    }
}

void CriticalSection::fail(RunReport &report, ErrorKind kind, const std::string &message,
                           int exitCode, int signalNumber)
{
    report.errorKind = kind;
    report.errorMessage = message;
    report.exitCode = exitCode;
    if (signalNumber != 0) {
        report.interruptSignal = signalNumber;
    }

    if (!report.stillFrozen.empty()) {
        // Worst case: a filesystem may remain frozen after we exit.
        const std::string stuck = describeTargets(report.stillFrozen);
        report.errorMessage += "; still frozen: " + stuck;
        if (kind != ErrorKind::Unfreeze) {
            report.errorKind = ErrorKind::Unfreeze;
        }
        SFLOG_ERROR(QStringLiteral("CriticalSection"),
                    QStringLiteral("fail"),
                    QStringLiteral("filesystems_left_frozen"),
                    QString::fromStdString(message),
                    QStringLiteral("fithaw"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"stillFrozen", report.stillFrozen}}));
        qCritical() << "snapfreeze: CRITICAL: filesystems may still be frozen:"
                    << QString::fromStdString(stuck);
        m_state = RunState::Failed;
        return;
    }

    m_state = m_recoveryFired || m_unfreezeStarted ? RunState::FailedRecovered
                                                   : RunState::Failed;

    SFLOG_ERROR(QStringLiteral("CriticalSection"),
                QStringLiteral("fail"),
                QStringLiteral("run_failed"),
                QString::fromStdString(message),
                QStringLiteral("state_machine"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"kind", kind},
                                {"state", m_state},
                                {"exitCode", exitCode},
                                {"recoveries", report.recoveryCount}}));
}

RunReport CriticalSection::run(const SnapshotRequest &request)
{
    RunReport report;
    report.startedAt = std::chrono::system_clock::now();
    report.correlationId = logging::currentCorrelationId().toStdString();

    m_state = RunState::Idle;
    m_recoveryFired = false;
    m_unfreezeStarted = false;

    SnapshotRequester requester(m_api);

    try {
        report.instanceId = m_context.instanceId();
        report.region = m_context.region();
        report.volumes = m_context.attachedVolumes(report.instanceId, report.region);
        if (report.volumes.empty()) {
            throw ContextError("no volumes attached to instance " + report.instanceId);
        }
        interruption::throwIfInterrupted();

        setState(RunState::Syncing);
        m_sync();
        report.targets = m_enumerate();
        interruption::throwIfInterrupted();

        SFLOG_INFO(QStringLiteral("CriticalSection"),
                   QStringLiteral("run"),
                   QStringLiteral("critical_section_enter"),
                   QStringLiteral("snapshot_run"),
                   QStringLiteral("freeze_snapshot_unfreeze"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"instanceId", report.instanceId},
                                   {"region", report.region},
                                   {"volumes", report.volumes},
                                   {"targets", report.targets}}));

        HeldLogOutput heldLog(m_freezer);
        RecoveryGuard guard(*this, report);

        setState(RunState::Freezing);
        m_frozenAt = std::chrono::steady_clock::now();
        const FreezeOutcome frozen = m_freezer.freeze(report.targets);
        report.frozenTargets = frozen.frozen;
        if (frozen.interrupted) {
            throw InterruptedError(interruption::pendingSignal());
        }
        if (!frozen.ok()) {
            throw FreezeError("failed to freeze " + frozen.failedTarget->mountPoint,
                              frozen.osError, *frozen.failedTarget);
        }

        setState(RunState::Snapshotting);
        try {
            report.results = requester.requestSnapshots(report.volumes, request, report.region);
        } catch (const InterruptedError &) {
            report.results = requester.collected();
            throw;
        }

        setState(RunState::Unfreezing);
        m_unfreezeStarted = true;
        const UnfreezeOutcome thawed = m_freezer.unfreezeAll();
        report.frozenDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_frozenAt);
        if (!thawed.ok()) {
            report.stillFrozen = thawed.failedTargets();
            throw UnfreezeError("failed to unfreeze " + describeTargets(report.stillFrozen),
                                thawed.firstOsError(), thawed.failedTargets());
        }

        setState(RunState::Done);
        report.exitCode = kExitSuccess;
    } catch (const SnapfreezeError &ex) {
        const int signalNumber = ex.kind() == ErrorKind::Interrupted ? ex.code() : 0;
        fail(report, ex.kind(), ex.what(), ex.exitCode(), signalNumber);
    } catch (const std::exception &ex) {
        fail(report, ErrorKind::Internal, ex.what(), kExitGenericFailure, 0);
    }

    report.state = m_state;
    report.finishedAt = std::chrono::system_clock::now();

    SFLOG_INFO(QStringLiteral("CriticalSection"),
               QStringLiteral("run"),
               QStringLiteral("run_finished"),
               QStringLiteral("snapshot_run"),
               QStringLiteral("state_machine"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"state", report.state},
                               {"succeeded", report.succeededCount()},
                               {"failed", report.failedCount()},
                               {"frozenMs", report.frozenDuration.count()},
                               {"exitCode", report.exitCode}}));

    return report;
}

} // namespace snapfreeze
