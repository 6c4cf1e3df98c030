#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace snapfreeze {

constexpr int kExitSuccess = 0;
constexpr int kExitGenericFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitContext = 3;
constexpr int kExitEnumeration = 4;
constexpr int kExitLockBusy = 5;

// Maps an OS or child-process code onto a usable exit status.
inline int exitCodeFrom(int code)
{
    if (code > 0 && code < 256) {
        return code;
    }
    return kExitGenericFailure;
}

class SnapfreezeError : public std::runtime_error
{
public:
    SnapfreezeError(ErrorKind kind, const std::string &message, int code)
        : std::runtime_error(message)
        , m_kind(kind)
        , m_code(code)
    {
    }

    ErrorKind kind() const { return m_kind; }

    // Underlying error code (errno, child exit status); 0 when unknown.
    int code() const { return m_code; }

    virtual int exitCode() const { return exitCodeFrom(m_code); }

private:
    ErrorKind m_kind;
    int m_code;
};

class ConfigError : public SnapfreezeError
{
public:
    explicit ConfigError(const std::string &message)
        : SnapfreezeError(ErrorKind::Config, message, kExitUsage)
    {
    }
};

class ContextError : public SnapfreezeError
{
public:
    explicit ContextError(const std::string &message)
        : SnapfreezeError(ErrorKind::Context, message, kExitContext)
    {
    }
};

class EnumerationError : public SnapfreezeError
{
public:
    EnumerationError(const std::string &message, int osError)
        : SnapfreezeError(ErrorKind::Enumeration, message, osError)
    {
    }

    int exitCode() const override { return kExitEnumeration; }
};

class LockError : public SnapfreezeError
{
public:
    explicit LockError(const std::string &message)
        : SnapfreezeError(ErrorKind::Lock, message, kExitLockBusy)
    {
    }
};

class FreezeError : public SnapfreezeError
{
public:
    FreezeError(const std::string &message, int osError, MountTarget failedTarget)
        : SnapfreezeError(ErrorKind::Freeze, message, osError)
        , m_failedTarget(std::move(failedTarget))
    {
    }

    const MountTarget &failedTarget() const { return m_failedTarget; }

private:
    MountTarget m_failedTarget;
};

class UnfreezeError : public SnapfreezeError
{
public:
    UnfreezeError(const std::string &message, int osError,
                  std::vector<MountTarget> stillFrozen)
        : SnapfreezeError(ErrorKind::Unfreeze, message, osError)
        , m_stillFrozen(std::move(stillFrozen))
    {
    }

    const std::vector<MountTarget> &stillFrozen() const { return m_stillFrozen; }

private:
    std::vector<MountTarget> m_stillFrozen;
};

class InterruptedError : public SnapfreezeError
{
public:
    explicit InterruptedError(int signalNumber)
        : SnapfreezeError(ErrorKind::Interrupted,
                          "interrupted by signal " + std::to_string(signalNumber),
                          signalNumber)
    {
    }

    int signalNumber() const { return code(); }

    int exitCode() const override { return 128 + code(); }
};

} // namespace snapfreeze
