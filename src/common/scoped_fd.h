// RAII owner for pipe and pseudo-terminal descriptors handed out by
// Subprocess and ShellSession.
#ifndef PATCHARBITER_SRC_COMMON_SCOPED_FD_H_
#define PATCHARBITER_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace PatchArbiter {

struct ScopedFd {
	int fd = -1;

	ScopedFd() = default;
	explicit ScopedFd(int f) : fd(f) {}

	~ScopedFd() { reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& o) noexcept : fd(o.fd) { o.fd = -1; }
	ScopedFd& operator=(ScopedFd&& o) noexcept {
		if (this != &o) {
			reset();
			fd = o.fd;
			o.fd = -1;
		}
		return *this;
	}

	int get() const { return fd; }
	bool valid() const { return fd >= 0; }

	void reset(int f = -1) {
		if (fd >= 0) ::close(fd);
		fd = f;
	}
};

}  // namespace PatchArbiter

#endif  // PATCHARBITER_SRC_COMMON_SCOPED_FD_H_
