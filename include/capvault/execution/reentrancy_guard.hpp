#pragma once

namespace capvault::execution {

/// Scoped owner of a reentrancy flag.
///
/// Construction takes the flag if it is clear; the destructor clears it again
/// only when this guard took it, on every exit path.
class reentrancy_guard final {
 public:
  explicit reentrancy_guard(bool& locked) : locked_{locked} {
    if (!locked_) {
      locked_ = true;
      acquired_ = true;
    }
  }

  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;
  reentrancy_guard(reentrancy_guard&&) = delete;
  reentrancy_guard& operator=(reentrancy_guard&&) = delete;

  ~reentrancy_guard() {
    if (acquired_) {
      locked_ = false;
    }
  }

  bool acquired() const { return acquired_; }

 private:
  bool& locked_;
  bool acquired_{false};
};

}  // namespace capvault::execution
