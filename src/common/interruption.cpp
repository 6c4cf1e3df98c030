#include "common/interruption.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace snapfreeze::interruption {

namespace {

constexpr std::array<int, 4> kHandledSignals = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

static_assert(std::atomic<int>::is_always_lock_free,
              "signal flag must be usable from a signal handler");

std::atomic<int> g_pendingSignal{0};
std::array<struct sigaction, kHandledSignals.size()> g_previous{};
bool g_installed = false;

void onSignal(int signalNumber)
{
    int expected = 0;
    g_pendingSignal.compare_exchange_strong(expected, signalNumber);
}

} // namespace

void install()
{
    if (g_installed) {
        return;
    }

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = onSignal;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: blocking syscalls return EINTR so waits notice the signal.
    action.sa_flags = 0;

    for (std::size_t i = 0; i < kHandledSignals.size(); ++i) {
        if (sigaction(kHandledSignals[i], &action, &g_previous[i]) != 0) {
            SFLOG_WARN(QStringLiteral("Interruption"),
                       QStringLiteral("install"),
                       QStringLiteral("sigaction_failed"),
                       QString::fromLocal8Bit(std::strerror(errno)),
                       QStringLiteral("sigaction"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"signal", kHandledSignals[i]}}));
        }
    }
    g_installed = true;
}

void uninstall()
{
    if (!g_installed) {
        return;
    }
    for (std::size_t i = 0; i < kHandledSignals.size(); ++i) {
        sigaction(kHandledSignals[i], &g_previous[i], nullptr);
    }
    g_installed = false;
}

int pendingSignal()
{
    return g_pendingSignal.load();
}

bool isInterrupted()
{
    return g_pendingSignal.load() != 0;
}

void throwIfInterrupted()
{
    const int signalNumber = g_pendingSignal.load();
    if (signalNumber != 0) {
        throw InterruptedError(signalNumber);
    }
}

void trigger(int signalNumber)
{
    onSignal(signalNumber);
}

void reset()
{
    g_pendingSignal.store(0);
}

} // namespace snapfreeze::interruption
