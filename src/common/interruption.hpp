#pragma once

namespace snapfreeze::interruption {

// Installs handlers for SIGINT, SIGTERM, SIGHUP and SIGQUIT. The handlers only
// record the first signal received; the orchestrator polls for it and runs
// recovery on its own stack.
void install();

// Restores the handlers that were active before install().
void uninstall();

// First signal received since the last reset(), or 0.
int pendingSignal();

bool isInterrupted();

// Throws InterruptedError when a signal is pending.
void throwIfInterrupted();

// Marks the process as interrupted without delivering a real signal.
void trigger(int signalNumber);

void reset();

} // namespace snapfreeze::interruption
