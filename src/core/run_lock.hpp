#pragma once

#include <memory>

#include <QLockFile>
#include <QString>

namespace snapfreeze {

// Single-instance guard for the freeze/snapshot sequence on this host.
// Held for the lifetime of the object; stale locks left by a dead process
// are reclaimed.
class RunLock
{
public:
    // Throws LockError when another live process holds the lock.
    explicit RunLock(const QString &path);
    ~RunLock();

    RunLock(const RunLock &) = delete;
    RunLock &operator=(const RunLock &) = delete;

    const QString &path() const { return m_path; }

private:
    QString m_path;
    std::unique_ptr<QLockFile> m_lock;
};

} // namespace snapfreeze
