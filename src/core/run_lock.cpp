#include "core/run_lock.hpp"

#include <QDir>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace snapfreeze {

RunLock::RunLock(const QString &path)
    : m_path(path)
    , m_lock(std::make_unique<QLockFile>(path))
{
    QDir().mkpath(QFileInfo(path).absolutePath());

    // A lock is only stale when its owner is gone; no age-based takeover.
    m_lock->setStaleLockTime(0);
    if (m_lock->tryLock(0)) {
        return;
    }

    qint64 pid = 0;
    QString hostname;
    QString appname;
    m_lock->getLockInfo(&pid, &hostname, &appname);

    std::string reason;
    switch (m_lock->error()) {
    case QLockFile::LockFailedError:
        reason = "held by pid " + std::to_string(pid);
        break;
    case QLockFile::PermissionError:
        reason = "permission denied";
        break;
    default:
        reason = "unknown error";
        break;
    }

    SFLOG_WARN(QStringLiteral("RunLock"),
               QStringLiteral("RunLock"),
               QStringLiteral("lock_busy"),
               QString::fromStdString(reason),
               QStringLiteral("qlockfile"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"path", path.toStdString()}, {"pid", pid}}));

    throw LockError("cannot acquire run lock " + path.toStdString() + ": " + reason);
}

RunLock::~RunLock()
{
    m_lock->unlock();
}

} // namespace snapfreeze
