#include "core/freeze_controller.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/interruption.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/mount_table.hpp"

namespace snapfreeze {

namespace {

class ScopedFd
{
public:
    explicit ScopedFd(int fd)
        : m_fd(fd)
    {
    }

    ~ScopedFd()
    {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }

    ScopedFd(const ScopedFd &) = delete;
    ScopedFd &operator=(const ScopedFd &) = delete;

    int get() const { return m_fd; }

private:
    int m_fd;
};

BackendResult ioctlOnMount(const std::string &mountPoint, unsigned long request)
{
    ScopedFd fd(::open(mountPoint.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (fd.get() < 0) {
        return {FreezeStatus::Failed, errno};
    }

    int rc = -1;
    do {
        rc = ::ioctl(fd.get(), request, 0);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        return {FreezeStatus::Failed, errno};
    }
    return {FreezeStatus::Ok, 0};
}

QString errnoText(int osError)
{
    return QString::fromLocal8Bit(std::strerror(osError));
}

} // namespace

BackendResult IoctlFreezeBackend::freeze(const std::string &mountPoint)
{
    // EBUSY (frozen by someone else) stays a failure: the freeze is not ours to thaw.
    return ioctlOnMount(mountPoint, FIFREEZE);
}

BackendResult IoctlFreezeBackend::thaw(const std::string &mountPoint)
{
    BackendResult result = ioctlOnMount(mountPoint, FITHAW);
    if (result.status == FreezeStatus::Failed && result.osError == EINVAL) {
        // The kernel reports EINVAL for a filesystem that is not frozen.
        return {FreezeStatus::NoChange, 0};
    }
    return result;
}

std::vector<MountTarget> UnfreezeOutcome::failedTargets() const
{
    std::vector<MountTarget> targets;
    targets.reserve(errors.size());
    for (const auto &error : errors) {
        targets.push_back(error.target);
    }
    return targets;
}

FreezeController::FreezeController(std::unique_ptr<FreezeBackend> backend)
    : m_backend(std::move(backend))
{
}

FreezeOutcome FreezeController::freeze(const std::vector<MountTarget> &targets)
{
    FreezeOutcome outcome;

    for (const auto &target : targets) {
        if (isRootMount(target.mountPoint)) {
            SFLOG_WARN(QStringLiteral("FreezeController"),
                       QStringLiteral("freeze"),
                       QStringLiteral("root_skipped"),
                       QStringLiteral("root_never_frozen"),
                       QStringLiteral("guard"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json::object());
            continue;
        }
        if (isFrozen(target)) {
            continue;
        }
        if (interruption::isInterrupted()) {
            outcome.interrupted = true;
            return outcome;
        }

        const BackendResult result = m_backend->freeze(target.mountPoint);
        if (result.status != FreezeStatus::Ok) {
            outcome.failedTarget = target;
            outcome.osError = result.osError;
            SFLOG_ERROR(QStringLiteral("FreezeController"),
                        QStringLiteral("freeze"),
                        QStringLiteral("freeze_failed"),
                        errnoText(result.osError),
                        QStringLiteral("fifreeze"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"target", target},
                                        {"errno", result.osError},
                                        {"frozenSoFar", outcome.frozen.size()}}));
            return outcome;
        }

        m_frozen.push_back(target);
        outcome.frozen.push_back(target);
        SFLOG_DEBUG(QStringLiteral("FreezeController"),
                    QStringLiteral("freeze"),
                    QStringLiteral("target_frozen"),
                    QStringLiteral("critical_section"),
                    QStringLiteral("fifreeze"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"target", target}}));
    }

    return outcome;
}

UnfreezeOutcome FreezeController::unfreeze(const std::vector<MountTarget> &targets)
{
    UnfreezeOutcome outcome;

    // Errors on one target never stop the loop; every target gets its attempt.
    for (const auto &target : targets) {
        if (isRootMount(target.mountPoint)) {
            continue;
        }

        const BackendResult result = m_backend->thaw(target.mountPoint);
        if (result.status == FreezeStatus::Failed) {
            outcome.errors.push_back({target, result.osError});
            SFLOG_ERROR(QStringLiteral("FreezeController"),
                        QStringLiteral("unfreeze"),
                        QStringLiteral("thaw_failed"),
                        errnoText(result.osError),
                        QStringLiteral("fithaw"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"target", target},
                                        {"errno", result.osError}}));
            continue;
        }

        if (result.status == FreezeStatus::Ok) {
            outcome.thawed.push_back(target);
        }
        forget(target);
    }

    return outcome;
}

UnfreezeOutcome FreezeController::unfreezeAll()
{
    // Copy: unfreeze() mutates m_frozen while iterating.
    const std::vector<MountTarget> known = m_frozen;
    return unfreeze(known);
}

bool FreezeController::isFrozen(const MountTarget &target) const
{
    return std::find(m_frozen.begin(), m_frozen.end(), target) != m_frozen.end();
}

void FreezeController::forget(const MountTarget &target)
{
    m_frozen.erase(std::remove(m_frozen.begin(), m_frozen.end(), target),
                   m_frozen.end());
}

} // namespace snapfreeze
