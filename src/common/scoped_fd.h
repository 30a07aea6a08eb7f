// RAII wrapper for file descriptors (capture pipes, /dev/null).
// Ensures fd is closed on scope exit; prevents leaks on early return or exception.
#ifndef TRACEDIFF_SRC_COMMON_SCOPED_FD_H_
#define TRACEDIFF_SRC_COMMON_SCOPED_FD_H_

#include <unistd.h>

namespace TraceDiff {

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

	void reset() {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}
};

}  // namespace TraceDiff

#endif  // TRACEDIFF_SRC_COMMON_SCOPED_FD_H_
