#pragma once

#include <string>
#include <utility>

// A simple implementation of a Status class similar to RocksDB's design.
class Status {
public:
  // Error codes used to represent the result of an operation.
  enum Code {
    kOk = 0,
    kNotFound,
    kCorruption,
    kInvalidArgument,
    kIOError,
    kAlreadyExists,
    kAlreadyAttached,
    kNotRegularEntry,  // neither a directory nor a regular file
    kNotRegularFile,
    kIdentityMismatch, // on-disk uuid no longer matches the caller's
    kStaleTimestamp,   // mtime moved since the caller's reference point
    kNodeDetached,
    kNodeNotFound,
  };

  // Default constructor creates an OK status.
  Status() : code_(kOk), msg_("") {}

  // Constructor for creating an error status with a message.
  Status(Code code, std::string msg) : code_(code), msg_(std::move(msg)) {}

  // Copy constructor and assignment operators are defaulted.
  Status(const Status &other) = default;
  Status(Status &&other) noexcept = default;
  Status &operator=(const Status &other) = default;
  Status &operator=(Status &&other) noexcept = default;

  // Returns true if the status represents success.
  bool ok() const { return code_ == kOk; }

  Code code() const { return code_; }
  const std::string &message() const { return msg_; }

  bool IsNotFound() const { return code_ == kNotFound; }
  bool IsInvalidArgument() const { return code_ == kInvalidArgument; }
  bool IsIOError() const { return code_ == kIOError; }
  bool IsAlreadyExists() const { return code_ == kAlreadyExists; }
  bool IsAlreadyAttached() const { return code_ == kAlreadyAttached; }
  bool IsNotRegularEntry() const { return code_ == kNotRegularEntry; }
  bool IsNotRegularFile() const { return code_ == kNotRegularFile; }
  bool IsIdentityMismatch() const { return code_ == kIdentityMismatch; }
  bool IsStaleTimestamp() const { return code_ == kStaleTimestamp; }
  bool IsNodeDetached() const { return code_ == kNodeDetached; }
  bool IsNodeNotFound() const { return code_ == kNodeNotFound; }

  // Returns a human-readable string representation of this status.
  std::string ToString() const {
    if (ok()) {
      return "OK";
    } else {
      return CodeToString(code_) + ": " + msg_;
    }
  }

  // Factory methods for common statuses.
  static Status OK() { return Status(); }
  static Status NotFound(const std::string &msg) {
    return Status(kNotFound, msg);
  }
  static Status Corruption(const std::string &msg) {
    return Status(kCorruption, msg);
  }
  static Status InvalidArgument(const std::string &msg) {
    return Status(kInvalidArgument, msg);
  }
  static Status IOError(const std::string &msg) {
    return Status(kIOError, msg);
  }
  static Status AlreadyExists(const std::string &msg) {
    return Status(kAlreadyExists, msg);
  }
  static Status AlreadyAttached(const std::string &msg) {
    return Status(kAlreadyAttached, msg);
  }
  static Status NotRegularEntry(const std::string &msg) {
    return Status(kNotRegularEntry, msg);
  }
  static Status NotRegularFile(const std::string &msg) {
    return Status(kNotRegularFile, msg);
  }
  static Status IdentityMismatch(const std::string &msg) {
    return Status(kIdentityMismatch, msg);
  }
  static Status StaleTimestamp(const std::string &msg) {
    return Status(kStaleTimestamp, msg);
  }
  static Status NodeDetached(const std::string &msg) {
    return Status(kNodeDetached, msg);
  }
  static Status NodeNotFound(const std::string &msg) {
    return Status(kNodeNotFound, msg);
  }

  // Comparison operators.
  bool operator==(const Status &other) const {
    return code_ == other.code_ && msg_ == other.msg_;
  }
  bool operator!=(const Status &other) const { return !(*this == other); }

private:
  Code code_;
  std::string msg_;

  // Helper function to convert an error code to a string.
  static std::string CodeToString(Code code) {
    switch (code) {
    case kOk:
      return "OK";
    case kNotFound:
      return "NotFound";
    case kCorruption:
      return "Corruption";
    case kInvalidArgument:
      return "InvalidArgument";
    case kIOError:
      return "IOError";
    case kAlreadyExists:
      return "AlreadyExists";
    case kAlreadyAttached:
      return "AlreadyAttached";
    case kNotRegularEntry:
      return "NotRegularEntry";
    case kNotRegularFile:
      return "NotRegularFile";
    case kIdentityMismatch:
      return "IdentityMismatch";
    case kStaleTimestamp:
      return "StaleTimestamp";
    case kNodeDetached:
      return "NodeDetached";
    case kNodeNotFound:
      return "NodeNotFound";
    default:
      return "UnknownError";
    }
  }
};
