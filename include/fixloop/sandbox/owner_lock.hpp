#pragma once

#include "fixloop/core/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace fixloop {

// Exclusive claim on an owner id under a workspace root, held as an flock
// on <workspace_root>/<owner>.lock. The kernel drops it when the holder
// exits, so a crashed worker never leaves the owner stuck.
class OwnerLock {
public:
  // OwnerBusy when another open file description holds the lock.
  [[nodiscard]] static auto acquire(const std::filesystem::path& workspace_root,
                                    std::string owner) -> Result<OwnerLock>;

  OwnerLock(OwnerLock&& other) noexcept;
  auto operator=(OwnerLock&& other) noexcept -> OwnerLock&;
  OwnerLock(const OwnerLock&) = delete;
  auto operator=(const OwnerLock&) -> OwnerLock& = delete;
  ~OwnerLock();

  [[nodiscard]] auto owner() const noexcept -> const std::string& {
    return owner_;
  }
  [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& {
    return root_;
  }

  // True when this lock covers sandboxes of `owner` under `workspace_root`.
  [[nodiscard]] auto covers(const std::filesystem::path& workspace_root,
                            std::string_view owner) const -> bool;

private:
  OwnerLock(int fd, std::filesystem::path root, std::string owner);
  auto release() noexcept -> void;

  int fd_{-1};
  std::filesystem::path root_;
  std::string owner_;
};

}  // namespace fixloop
