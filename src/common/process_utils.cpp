#include "common/process_utils.hpp"

#include <QElapsedTimer>
#include <QProcess>

#include <nlohmann/json.hpp>

#include "common/interruption.hpp"
#include "common/logging.hpp"

namespace snapfreeze {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr int kKillGraceMs = 2000;

void stopChild(QProcess &process)
{
    process.kill();
    process.waitForFinished(kKillGraceMs);
}

} // namespace

QString CommandResult::failureText(const QString &program) const
{
    if (!started) {
        return QStringLiteral("failed to start %1").arg(program);
    }
    if (interrupted) {
        return QStringLiteral("%1 killed after interruption").arg(program);
    }
    if (timedOut) {
        return QStringLiteral("%1 timed out").arg(program);
    }
    if (crashed) {
        return QStringLiteral("%1 crashed").arg(program);
    }
    const QString detail = standardError.trimmed();
    if (!detail.isEmpty()) {
        return detail;
    }
    return QStringLiteral("%1 exited with status %2").arg(program).arg(exitCode);
}

CommandResult runCommand(const QString &program,
                         const QStringList &arguments,
                         std::chrono::milliseconds timeout)
{
    CommandResult result;

    SFLOG_DEBUG(QStringLiteral("ProcessUtils"),
                QStringLiteral("runCommand"),
                QStringLiteral("command_start"),
                QStringLiteral("external_call"),
                QStringLiteral("qprocess"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"program", program.toStdString()},
                                {"args", arguments.size()}}));

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        return result;
    }
    result.started = true;

    process.closeWriteChannel();

    QElapsedTimer elapsed;
    elapsed.start();
    while (!process.waitForFinished(kPollIntervalMs)) {
        if (process.state() == QProcess::NotRunning) {
            break;
        }
        if (interruption::isInterrupted()) {
            stopChild(process);
            result.interrupted = true;
            return result;
        }
        if (elapsed.elapsed() >= timeout.count()) {
            stopChild(process);
            result.timedOut = true;
            return result;
        }
    }

    result.crashed = process.exitStatus() != QProcess::NormalExit;
    result.exitCode = process.exitCode();
    result.standardOutput = QString::fromUtf8(process.readAllStandardOutput());
    result.standardError = QString::fromUtf8(process.readAllStandardError());
    return result;
}

QString defaultLockFilePath()
{
    const QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (!runtimeDir.isEmpty()) {
        return runtimeDir + QStringLiteral("/snapfreeze.lock");
    }
    return QStringLiteral("/run/snapfreeze.lock");
}

} // namespace snapfreeze
