#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace snapfreeze {

enum class FreezeStatus {
    Ok,
    // The filesystem was not frozen (thaw) or already frozen (freeze).
    NoChange,
    Failed
};

struct BackendResult {
    FreezeStatus status = FreezeStatus::Ok;
    int osError = 0;
};

// Kernel-facing seam. One call per mount point.
class FreezeBackend
{
public:
    virtual ~FreezeBackend() = default;

    virtual BackendResult freeze(const std::string &mountPoint) = 0;
    virtual BackendResult thaw(const std::string &mountPoint) = 0;
};

// FIFREEZE / FITHAW on a descriptor opened on the mount point.
class IoctlFreezeBackend : public FreezeBackend
{
public:
    BackendResult freeze(const std::string &mountPoint) override;
    BackendResult thaw(const std::string &mountPoint) override;
};

struct FreezeOutcome {
    // Exactly the targets this call froze, in order.
    std::vector<MountTarget> frozen;
    std::optional<MountTarget> failedTarget;
    int osError = 0;
    bool interrupted = false;

    bool ok() const { return !failedTarget.has_value() && !interrupted; }
};

struct UnfreezeOutcome {
    struct TargetError {
        MountTarget target;
        int osError = 0;
    };

    std::vector<MountTarget> thawed;
    std::vector<TargetError> errors;

    bool ok() const { return errors.empty(); }
    int firstOsError() const { return errors.empty() ? 0 : errors.front().osError; }
    std::vector<MountTarget> failedTargets() const;
};

/**
 * FreezeController owns the process-wide FreezeState: the set of mount
 * targets this process currently holds frozen.
 *
 * freeze() stops at the first failure and never thaws on its own; the caller
 * decides on recovery using the reported `frozen` list or frozenTargets().
 * unfreeze() always visits every target and is safe to repeat.
 */
class FreezeController
{
public:
    explicit FreezeController(std::unique_ptr<FreezeBackend> backend);

    FreezeOutcome freeze(const std::vector<MountTarget> &targets);
    UnfreezeOutcome unfreeze(const std::vector<MountTarget> &targets);

    // Unfreeze over the full known FreezeState.
    UnfreezeOutcome unfreezeAll();

    const std::vector<MountTarget> &frozenTargets() const { return m_frozen; }
    bool hasFrozenTargets() const { return !m_frozen.empty(); }

private:
    bool isFrozen(const MountTarget &target) const;
    void forget(const MountTarget &target);

    std::unique_ptr<FreezeBackend> m_backend;
    std::vector<MountTarget> m_frozen;
};

} // namespace snapfreeze
