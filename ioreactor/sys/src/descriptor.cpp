#include "ioreactor/descriptor.hpp"

#include <fcntl.h>
#include <pthread.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <ctime>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <span>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

#include "ioreactor/base-fd.hpp"
#include "ioreactor/errno-throw.hpp"
#include "ioreactor/log.hpp"
#include "ioreactor/platform.hpp"
#include "ioreactor/socket-ops.hpp"

namespace ioreactor {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

namespace {

// write(2) that does not raise SIGPIPE when the reading end of a pipe / FIFO is gone (sockets use MSG_NOSIGNAL
// instead). SIGPIPE is blocked for the calling thread during the write, and the one generated by an EPIPE
// failure is consumed before restoring the mask. A SIGPIPE already pending before the call is left untouched.
ssize_t WriteNoSigPipe(int fd, const void* data, std::size_t len) noexcept {
  sigset_t sigPipeSet;
  ::sigemptyset(&sigPipeSet);
  ::sigaddset(&sigPipeSet, SIGPIPE);

  sigset_t pendingSet;
  ::sigemptyset(&pendingSet);
  ::sigpending(&pendingSet);
  const bool alreadyPending = ::sigismember(&pendingSet, SIGPIPE) == 1;

  sigset_t previousMask;
  if (!alreadyPending && ::pthread_sigmask(SIG_BLOCK, &sigPipeSet, &previousMask) != 0) {
    // Cannot happen with a valid signal set: write without the protection.
    return ::write(fd, data, len);
  }

  const ssize_t nbWritten = ::write(fd, data, len);
  const int savedErrno = errno;

  if (!alreadyPending) {
    if (nbWritten == -1 && savedErrno == EPIPE) {
      static constexpr timespec kNoWait{};
      while (::sigtimedwait(&sigPipeSet, nullptr, &kNoWait) == -1 && errno == EINTR) {
      }
    }
    ::pthread_sigmask(SIG_SETMASK, &previousMask, nullptr);
  }
  errno = savedErrno;
  return nbWritten;
}

}  // namespace

void DescriptorOwner::SetOwner(Descriptor& desc, DescriptorOwner* owner) noexcept { desc._owner = owner; }

DescriptorOwner* DescriptorOwner::OwnerOf(const Descriptor& desc) noexcept { return desc._owner; }

void DescriptorOwner::FinishClose(Descriptor& desc) noexcept {
  desc._owner = nullptr;
  desc._baseFd.close();
  desc._state = Descriptor::State::Closed;
}

std::error_code DescriptorOwner::TakeFault(Descriptor& desc) noexcept {
  if (!desc._faultPending) {
    return {};
  }
  desc._faultPending = false;
  return {desc._lastError, std::generic_category()};
}

Descriptor::Descriptor(BaseFd baseFd, Kind kind, Interest interest)
    : _baseFd(std::move(baseFd)), _kind(kind), _interest(interest) {
  if (!_baseFd) {
    return;
  }
  if (!SetNonBlocking(_baseFd.fd())) {
    throw_errno("Unable to set fd # {} non-blocking", _baseFd.fd());
  }
  if (!SetCloseOnExec(_baseFd.fd())) {
    throw_errno("Unable to set close-on-exec on fd # {}", _baseFd.fd());
  }
  if (kind != Kind::File && !IsSocket(_baseFd.fd())) {
    throw std::invalid_argument("Socket / Proxy descriptor requires a socket handle");
  }
  _state = State::Open;
  log::debug("{} descriptor fd # {} opened", DescriptorKindName(kind), _baseFd.fd());
}

Descriptor::Descriptor(Descriptor&& other) noexcept
    : _baseFd(std::move(other._baseFd)),
      _owner(std::exchange(other._owner, nullptr)),
      _lastError(std::exchange(other._lastError, 0)),
      _kind(other._kind),
      _state(std::exchange(other._state, State::Closed)),
      _interest(std::exchange(other._interest, Interest::None)),
      _faultPending(std::exchange(other._faultPending, false)) {
  if (_owner != nullptr) {
    _owner->relocated(other, *this);
  }
}

Descriptor& Descriptor::operator=(Descriptor&& other) noexcept {
  if (this != &other) [[likely]] {
    if (_owner != nullptr) {
      _owner->detached(*this);
    }
    _baseFd = std::move(other._baseFd);
    _owner = std::exchange(other._owner, nullptr);
    _lastError = std::exchange(other._lastError, 0);
    _kind = other._kind;
    _state = std::exchange(other._state, State::Closed);
    _interest = std::exchange(other._interest, Interest::None);
    _faultPending = std::exchange(other._faultPending, false);
    if (_owner != nullptr) {
      _owner->relocated(other, *this);
    }
  }
  return *this;
}

Descriptor::~Descriptor() {
  if (_owner != nullptr) {
    _owner->detached(*this);
  }
}

Descriptor Descriptor::OpenFile(const char* path, int flags) {
  BaseFd baseFd(::open(path, flags | O_NONBLOCK | O_CLOEXEC, 0644));
  if (!baseFd) {
    throw_errno("Unable to open file '{}'", path);
  }
  return Descriptor(std::move(baseFd), Kind::File);
}

std::pair<Descriptor, Descriptor> Descriptor::CreatePipe() {
  int fds[2];
  if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) != 0) {
    throw_errno("pipe2 failed");
  }
  BaseFd readEnd(fds[0]);
  BaseFd writeEnd(fds[1]);
  return {Descriptor(std::move(readEnd), Kind::File, Interest::Read),
          Descriptor(std::move(writeEnd), Kind::File, Interest::None)};
}

void Descriptor::setInterest(Interest interest) {
  if (_state != State::Open) {
    throw std::logic_error("Cannot change the interest of a descriptor that is not open");
  }
  if (interest == _interest) {
    return;
  }
  const Interest previous = std::exchange(_interest, interest);
  if (_owner != nullptr) {
    try {
      _owner->interestChanged(*this);
    } catch (const std::exception&) {
      _interest = previous;
      throw;
    }
  }
}

IoResult Descriptor::recordFault(std::size_t bytes, int err) noexcept {
  _lastError = err;
  _faultPending = true;
  log::debug("I/O fault on fd # {}: errno={}, msg={}", fd(), err, SystemErrorMessage(err));
  return {bytes, IoStatus::Fatal, err};
}

IoResult Descriptor::read(std::span<std::byte> buf) {
  if (_state != State::Open) {
    return {0, IoStatus::Fatal, EBADF};
  }
  while (true) {
    const auto nbRead = ::read(fd(), buf.data(), buf.size());
    if (nbRead > 0) {
      return {static_cast<std::size_t>(nbRead), IoStatus::Ok, 0};
    }
    if (nbRead == 0) {
      return {0, buf.empty() ? IoStatus::Ok : IoStatus::Eof, 0};
    }
    const int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN) {
      return {0, IoStatus::WouldBlock, 0};
    }
    return recordFault(0, err);
  }
}

IoResult Descriptor::write(std::span<const std::byte> data) {
  if (_state != State::Open) {
    return {0, IoStatus::Fatal, EBADF};
  }
  IoResult ret;
  while (ret.bytes < data.size()) {
    const std::byte* pos = data.data() + ret.bytes;
    const std::size_t len = data.size() - ret.bytes;
    const int64_t nbWritten =
        _kind == Kind::File ? static_cast<int64_t>(WriteNoSigPipe(fd(), pos, len)) : SafeSend(fd(), pos, len);
    if (nbWritten == -1) [[unlikely]] {
      const int err = errno;
      if (err == EINTR) {
        // Interrupted by signal, retry immediately
        continue;
      }
      if (err == EAGAIN) {
        // Kernel buffer full: caller should wait for writable event
        ret.status = IoStatus::WouldBlock;
        return ret;
      }
      // Fatal error (ECONNRESET, EPIPE, etc.)
      return recordFault(ret.bytes, err);
    }
    ret.bytes += static_cast<std::size_t>(nbWritten);
  }
  return ret;
}

void Descriptor::close() noexcept {
  if (_state != State::Open) {
    return;
  }
  if (_owner != nullptr && _owner->closing(*this)) {
    _state = State::Closing;
    return;
  }
  _owner = nullptr;
  _baseFd.close();
  _state = State::Closed;
}

NativeHandle Descriptor::release() noexcept {
  if (_owner != nullptr) {
    _owner->detached(*this);
    _owner = nullptr;
  }
  _state = State::Closed;
  _interest = Interest::None;
  return _baseFd.release();
}

std::string_view DescriptorKindName(Descriptor::Kind kind) noexcept {
  switch (kind) {
    case Descriptor::Kind::File:
      return "file";
    case Descriptor::Kind::Socket:
      return "socket";
    case Descriptor::Kind::Proxy:
      return "proxy";
    default:
      return "unknown";
  }
}

}  // namespace ioreactor
