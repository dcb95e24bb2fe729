#include "cancellation.h"

#include <csignal>
#include <cstring>

#include "errors.h"

namespace PatchArbiter {

namespace {

volatile std::sig_atomic_t g_cancelled = 0;

void OnTerminationSignal(int) {
	g_cancelled = 1;
}

}  // namespace

bool CancellationRequested() {
	return g_cancelled != 0;
}

void RequestCancellation() {
	g_cancelled = 1;
}

void ClearCancellation() {
	g_cancelled = 0;
}

void InstallCancellationHandlers() {
	struct sigaction sa;
	std::memset(&sa, 0, sizeof(sa));
	sa.sa_handler = OnTerminationSignal;
	sigemptyset(&sa.sa_mask);
	// No SA_RESTART: blocking poll()/read() must return EINTR so the flag is seen.
	sa.sa_flags = 0;
	sigaction(SIGINT, &sa, nullptr);
	sigaction(SIGTERM, &sa, nullptr);
}

void ThrowIfCancelled(const std::string& where) {
	if (CancellationRequested()) {
		throw AttemptCancelled("cancelled during " + where);
	}
}

}  // namespace PatchArbiter
