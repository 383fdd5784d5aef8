#include "fixloop/sandbox/owner_lock.hpp"

#include "fixloop/util/log.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fixloop {

namespace fs = std::filesystem;

auto OwnerLock::acquire(const fs::path& workspace_root, std::string owner)
    -> Result<OwnerLock> {
  if (owner.empty() || owner.find('/') != std::string::npos) {
    return fail(Error::InvalidArgument);
  }

  std::error_code ec;
  auto root = fs::absolute(workspace_root, ec);
  if (ec) {
    return fail(Error::SandboxInfrastructure);
  }
  fs::create_directories(root, ec);
  if (ec) {
    log::error("Cannot create workspace root {}: {}", root.string(),
               ec.message());
    return fail(Error::SandboxInfrastructure);
  }

  auto path = root / (owner + ".lock");
  int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    log::error("Cannot open {}: {}", path.string(), strerror(errno));
    return fail(Error::SandboxInfrastructure);
  }
  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK) {
      log::error("Owner {} is in use by another process ({})", owner,
                 path.string());
      return fail(Error::OwnerBusy);
    }
    log::error("Cannot lock {}: {}", path.string(), strerror(err));
    return fail(Error::SandboxInfrastructure);
  }

  // Informational only; the flock is the claim.
  auto pid = std::to_string(::getpid()) + "\n";
  if (::ftruncate(fd, 0) != 0 ||
      ::write(fd, pid.data(), pid.size()) !=
          static_cast<ssize_t>(pid.size())) {
    log::warn("Cannot record pid in {}: {}", path.string(), strerror(errno));
  }
  return OwnerLock(fd, std::move(root), std::move(owner));
}

OwnerLock::OwnerLock(int fd, fs::path root, std::string owner)
    : fd_(fd), root_(std::move(root)), owner_(std::move(owner)) {
}

OwnerLock::OwnerLock(OwnerLock&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      root_(std::move(other.root_)),
      owner_(std::move(other.owner_)) {
}

auto OwnerLock::operator=(OwnerLock&& other) noexcept -> OwnerLock& {
  if (this != &other) {
    release();
    fd_ = std::exchange(other.fd_, -1);
    root_ = std::move(other.root_);
    owner_ = std::move(other.owner_);
  }
  return *this;
}

OwnerLock::~OwnerLock() {
  release();
}

auto OwnerLock::release() noexcept -> void {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

auto OwnerLock::covers(const fs::path& workspace_root,
                       std::string_view owner) const -> bool {
  if (fd_ < 0 || owner != owner_) {
    return false;
  }
  std::error_code ec;
  auto root = fs::absolute(workspace_root, ec);
  return !ec && root.lexically_normal() == root_.lexically_normal();
}

}  // namespace fixloop
