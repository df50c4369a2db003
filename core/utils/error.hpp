#ifndef CORE_UTILS_ERROR_NOTIFICATION_HPP
#define CORE_UTILS_ERROR_NOTIFICATION_HPP

#include <ostream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace core::utils {

enum class ErrorKind {
  kContractViolation,
  kUnsupportedOperation,
  kBackendIo,
};

inline std::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kContractViolation:
    return "contract violation";
  case ErrorKind::kUnsupportedOperation:
    return "unsupported operation";
  case ErrorKind::kBackendIo:
    return "backend I/O failure";
  }
  return "unknown";
}

struct Error {
public:
  Error(ErrorKind kind, std::string message)
      : kind_(kind), message_(std::move(message)) {}

  static Error contract(std::string message) {
    return Error(ErrorKind::kContractViolation, std::move(message));
  }

  static Error unsupported(std::string message) {
    return Error(ErrorKind::kUnsupportedOperation, std::move(message));
  }

  static Error backend(std::string message) {
    return Error(ErrorKind::kBackendIo, std::move(message));
  }

  static Error backend(const std::exception &e) {
    return Error(ErrorKind::kBackendIo, e.what());
  }

  ErrorKind kind() const { return kind_; }

  const std::string &message() const { return message_; }
  std::string &message() { return message_; }

  std::string serialize() const {
    return std::string(to_string(kind_)) + ": " + message_;
  }

  friend std::ostream &operator<<(std::ostream &os, const Error &error) {
    os << error.serialize();
    return os;
  }

private:
  ErrorKind kind_;
  std::string message_;
};

// Backend failures log at error level, rejections at warn.
inline auto error_notification = [](const Error &error) {
  switch (error.kind()) {
  case ErrorKind::kBackendIo:
    spdlog::error("{}", error.serialize());
    break;
  case ErrorKind::kContractViolation:
  case ErrorKind::kUnsupportedOperation:
    spdlog::warn("{}", error.serialize());
    break;
  }
};

} // namespace core::utils

#endif // CORE_UTILS_ERROR_NOTIFICATION_HPP
