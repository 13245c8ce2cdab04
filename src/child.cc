#include "procex/child.hpp"

#include "procex/internal/access.hpp"
#include "procex/internal/backend.hpp"
#include "procex/internal/wait_policy.hpp"

namespace procex {

struct Child::Impl {
  explicit Impl(internal::Spawned spawned) : spawned_(spawned) {}

  internal::Spawned spawned_;
};

Child::Child(Child&& other) noexcept = default;
Child& Child::operator=(Child&& other) noexcept = default;
Child::~Child() = default;

namespace internal {

Child ChildAccess::from_spawned(Spawned spawned) {
  Child child;
  ChildAccess::impl(child) = std::make_unique<Child::Impl>(spawned);
  return child;
}

}  // namespace internal

int Child::id() const noexcept {
  if (!impl_) {
    return -1;
  }
  return impl_->spawned_.pid;
}

Result<ExitStatus> Child::wait() {
  if (!impl_) {
    return Error{.code = make_error_code(errc::wait_failed), .context = "wait"};
  }
  auto outcome = internal::default_backend().wait(impl_->spawned_, std::nullopt,
                                                  std::chrono::milliseconds(0));
  if (!outcome) {
    return outcome.error();
  }
  return outcome->status;
}

Result<std::optional<ExitStatus>> Child::try_wait() {
  if (!impl_) {
    return Error{.code = make_error_code(errc::wait_failed), .context = "try_wait"};
  }
  return internal::default_backend().try_wait(impl_->spawned_);
}

Result<WaitOutcome> Child::wait_for(WaitOptions options) {
  if (!impl_) {
    return Error{.code = make_error_code(errc::wait_failed), .context = "wait_for"};
  }
  auto valid = internal::validate_wait_options(options);
  if (!valid) {
    return valid.error();
  }
  return internal::default_backend().wait(impl_->spawned_, options.timeout, options.kill_grace);
}

Result<void> Child::terminate() {
  if (!impl_) {
    return Error{.code = make_error_code(errc::kill_failed), .context = "terminate"};
  }
  return internal::default_backend().terminate(impl_->spawned_);
}

Result<void> Child::kill() {
  if (!impl_) {
    return Error{.code = make_error_code(errc::kill_failed), .context = "kill"};
  }
  return internal::default_backend().kill(impl_->spawned_);
}

Result<void> Child::signal(int signo) {
  if (!impl_) {
    return Error{.code = make_error_code(errc::kill_failed), .context = "signal"};
  }
  return internal::default_backend().signal(impl_->spawned_, signo);
}

}  // namespace procex
