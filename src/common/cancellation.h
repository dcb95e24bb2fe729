#pragma once

#include <string>

namespace PatchArbiter {

// Process-wide cancellation flag. Set from SIGINT/SIGTERM handlers; polled by
// every blocking loop (shell reads, subprocess waits, HTTP transfers).
bool CancellationRequested();
void RequestCancellation();
void ClearCancellation();

// Installs async-signal-safe SIGINT/SIGTERM handlers that only set the flag.
void InstallCancellationHandlers();

// Throws AttemptCancelled carrying `where` when the flag is set.
void ThrowIfCancelled(const std::string& where);

}  // namespace PatchArbiter
