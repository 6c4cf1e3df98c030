#pragma once

#include <chrono>

#include <QString>
#include <QStringList>

namespace snapfreeze {

struct CommandResult {
    bool started = false;
    bool timedOut = false;
    // Set when a pending interruption cut the wait short; the child was killed.
    bool interrupted = false;
    bool crashed = false;
    int exitCode = -1;
    QString standardOutput;
    QString standardError;

    bool ok() const
    {
        return started && !timedOut && !interrupted && !crashed && exitCode == 0;
    }

    // Human readable reason for a failed command, stderr first.
    QString failureText(const QString &program) const;
};

/**
 * Run an external program and capture its output.
 *
 * The wait is bounded by `timeout` and polls the interruption flag, so a
 * SIGTERM delivered while the child runs is noticed within one poll interval.
 * The child is killed on timeout or interruption.
 */
CommandResult runCommand(const QString &program,
                         const QStringList &arguments,
                         std::chrono::milliseconds timeout);

// Resolves the lock path: XDG_RUNTIME_DIR when set, /run otherwise.
QString defaultLockFilePath();

} // namespace snapfreeze
