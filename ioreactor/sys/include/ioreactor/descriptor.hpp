#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ioreactor/base-fd.hpp"
#include "ioreactor/platform.hpp"

namespace ioreactor {

class Descriptor;

// Status of a non-blocking read / write attempt.
enum class IoStatus : uint8_t {
  Ok,          // bytes were transferred (all of them for write)
  WouldBlock,  // no (more) progress possible now, retry on next readiness
  Eof,         // orderly end of stream (read only)
  Fatal        // the handle is broken, the caller should close it
};

struct IoResult {
  std::size_t bytes{};
  IoStatus status{IoStatus::Ok};
  int err{};  // errno value when status is Fatal, 0 otherwise
};

// Component that a Descriptor notifies of its own changes while it is owned (the event loop).
class DescriptorOwner {
 public:
  DescriptorOwner() noexcept = default;

  DescriptorOwner(const DescriptorOwner&) = delete;
  DescriptorOwner(DescriptorOwner&&) = delete;
  DescriptorOwner& operator=(const DescriptorOwner&) = delete;
  DescriptorOwner& operator=(DescriptorOwner&&) = delete;

  virtual ~DescriptorOwner() = default;

 protected:
  friend class Descriptor;

  // The interest set of 'desc' changed. May throw std::system_error, the Descriptor then keeps its
  // previous interest.
  virtual void interestChanged(Descriptor& desc) = 0;

  // 'desc' is being closed. Returns true if the release of its handle should be deferred: the Descriptor
  // then stays in Closing state until the owner calls FinishClose().
  virtual bool closing(Descriptor& desc) noexcept = 0;

  // 'desc' has been move-constructed / move-assigned into 'to'.
  virtual void relocated(Descriptor& from, Descriptor& to) noexcept = 0;

  // 'desc' leaves its owner for good: it is being destroyed, overwritten or its handle released.
  // Ownership is dropped by the Descriptor right after this call.
  virtual void detached(Descriptor& desc) noexcept = 0;

  static void SetOwner(Descriptor& desc, DescriptorOwner* owner) noexcept;

  [[nodiscard]] static DescriptorOwner* OwnerOf(const Descriptor& desc) noexcept;

  // Releases the handle of a descriptor in Closing state.
  static void FinishClose(Descriptor& desc) noexcept;

  // Returns the fault recorded by the last failed read / write and not yet consumed, and consumes it.
  static std::error_code TakeFault(Descriptor& desc) noexcept;
};

// Uniform non-blocking wrapper over an OS handle: regular file / FIFO / tty, socket, or a socket
// tunnelled through a proxy.
// A Descriptor belongs to at most one event loop at a time. It is movable, also while registered
// (the loop follows the move), but not copyable.
class Descriptor {
 public:
  enum class Kind : uint8_t { File, Socket, Proxy };

  enum class State : uint8_t { Open, Closing, Closed };

  enum class Interest : uint8_t { None = 0, Read = 1, Write = 2, ReadWrite = Read | Write };

  // Default-constructed Descriptor is closed.
  Descriptor() noexcept = default;

  // Adopt the given handle and switch it to non-blocking, close-on-exec mode.
  // An invalid handle gives a Closed descriptor.
  // Throws std::system_error if the handle mode cannot be changed, and std::invalid_argument if a
  // Socket / Proxy kind is requested for a handle that is not a socket.
  explicit Descriptor(BaseFd baseFd, Kind kind = Kind::Socket, Interest interest = Interest::Read);

  Descriptor(const Descriptor&) = delete;
  Descriptor& operator=(const Descriptor&) = delete;

  Descriptor(Descriptor&& other) noexcept;
  Descriptor& operator=(Descriptor&& other) noexcept;

  ~Descriptor();

  // Opens a file (or FIFO, character device...) in non-blocking mode. 'flags' are the open(2) flags,
  // files created through O_CREAT get mode 0644.
  // Throws std::system_error on failure.
  static Descriptor OpenFile(const char* path, int flags);

  static Descriptor OpenFile(const std::string& path, int flags) { return OpenFile(path.c_str(), flags); }

  // Creates a non-blocking pipe, returned as (read end, write end), both of kind File.
  // Throws std::system_error on failure.
  static std::pair<Descriptor, Descriptor> CreatePipe();

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] bool isOpen() const noexcept { return _state == State::Open; }

  // Returns true if this descriptor is currently owned by an event loop.
  [[nodiscard]] bool isOwned() const noexcept { return _owner != nullptr; }

  [[nodiscard]] Interest interest() const noexcept { return _interest; }

  // Changes the readiness this descriptor waits for. When owned, the change is applied to the loop
  // backend immediately. Throws std::system_error on backend failure (interest left unchanged), and
  // std::logic_error if the descriptor is not open.
  void setInterest(Interest interest);

  // Reads at most buf.size() bytes. EINTR is retried.
  IoResult read(std::span<std::byte> buf);

  // Writes as much of data as possible. EINTR is retried. On WouldBlock, 'bytes' tells how many were
  // written before the kernel buffer filled up.
  IoResult write(std::span<const std::byte> data);

  IoResult write(std::string_view data) { return write(std::as_bytes(std::span<const char>(data))); }

  // Error of the last fatal read / write fault (0 if none).
  [[nodiscard]] int lastError() const noexcept { return _lastError; }

  // Closes the descriptor. Idempotent.
  // When owned by an event loop, the loop is notified first. If called from one of its callbacks, the
  // descriptor stays in Closing state until the end of the current dispatch cycle.
  void close() noexcept;

  // Release ownership of the underlying handle without closing it. If owned by an event loop, the descriptor
  // is unregistered first. The Descriptor is Closed afterwards.
  [[nodiscard]] NativeHandle release() noexcept;

 private:
  friend class DescriptorOwner;

  IoResult recordFault(std::size_t bytes, int err) noexcept;

  BaseFd _baseFd;
  DescriptorOwner* _owner{nullptr};
  int _lastError{};
  Kind _kind{Kind::File};
  State _state{State::Closed};
  Interest _interest{Interest::None};
  bool _faultPending{false};
};

constexpr Descriptor::Interest operator|(Descriptor::Interest lhs, Descriptor::Interest rhs) noexcept {
  return static_cast<Descriptor::Interest>(static_cast<uint8_t>(lhs) | static_cast<uint8_t>(rhs));
}

constexpr bool WantsRead(Descriptor::Interest interest) noexcept {
  return (static_cast<uint8_t>(interest) & static_cast<uint8_t>(Descriptor::Interest::Read)) != 0;
}

constexpr bool WantsWrite(Descriptor::Interest interest) noexcept {
  return (static_cast<uint8_t>(interest) & static_cast<uint8_t>(Descriptor::Interest::Write)) != 0;
}

std::string_view DescriptorKindName(Descriptor::Kind kind) noexcept;

}  // namespace ioreactor
