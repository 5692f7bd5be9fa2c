#pragma once

#include "txsession/base/stacktrace.hpp"

#include <cstdint>
#include <format>
#include <ostream>
#include <string>

namespace txsession {

/// Forward declaration of Error class
class Error;

/// All the error code names, values, and message formats are listed in this macro.
///
/// To add a new error code, simply add a new line in this macro with the
/// format, all the other code will be generated automatically.
///
/// Codes in [200, 300) are failures reported by the persistence engine, codes
/// in [300, 400) are the data access errors they are translated into.
#define TXSESSION_ERROR_CODE_LIST(ACTION)                                                          \
  ACTION(General, 1, "{}")                                                                         \
  ACTION(NotImplemented, 2, "{}")                                                                  \
  ACTION(InvalidArgument, 3, "{}")                                                                 \
  ACTION(ExecutorMismatch, 100,                                                                    \
         "Cannot change the executor mode when there is an existing transaction, bound={}, "       \
         "requested={}")                                                                           \
  ACTION(UnsupportedTxBinding, 101,                                                                \
         "Session factory must be transaction aware to join the ambient transaction, "             \
         "factory={}")                                                                             \
  ACTION(AlreadyBound, 102, "Resource already bound to the execution context, key={}")             \
  ACTION(NotBound, 103, "No resource bound to the execution context, key={}")                      \
  ACTION(UnsupportedOperation, 104, "Manual {} is not allowed over a managed session")             \
  ACTION(NoSynchronization, 105, "Transaction synchronization is not active, context={}")          \
  ACTION(NoTransaction, 106, "No existing transaction found for propagation {}")                   \
  ACTION(TxAlreadyCompleted, 107, "Transaction already completed, name={}")                        \
  ACTION(UnexpectedRollback, 108,                                                                  \
         "Transaction rolled back because it has been marked as rollback-only, name={}")           \
  ACTION(Persistence, 200, "Persistence failure, statement={}, cause={}")                          \
  ACTION(PersistenceConstraint, 201, "Constraint violated, statement={}, cause={}")                \
  ACTION(PersistenceGrammar, 202, "Bad statement, statement={}, cause={}")                         \
  ACTION(PersistenceTransient, 203, "Transient resource failure, statement={}, cause={}")          \
  ACTION(UncategorizedDataAccess, 300, "Uncategorized data access failure: {}")                    \
  ACTION(DataIntegrityViolation, 301, "Data integrity violation: {}")                              \
  ACTION(BadStatementGrammar, 302, "Bad statement grammar: {}")                                    \
  ACTION(TransientDataAccess, 303, "Transient data access failure: {}")

#define TXSESSION_ERROR_CODE(ename) k##ename

#define TXSESSION_ERROR_FMT(ename) k##ename##MsgFmt

#define TXSESSION_DEFINE_ERROR_CODE(ename, evalue, ...) TXSESSION_ERROR_CODE(ename) = evalue,

#define TXSESSION_DEFINE_ERROR_BUILDER(ename, ...)                                                 \
  template <typename... Args>                                                                      \
  static Error ename(Args&&... args) {                                                             \
    return Error(Error::Code::TXSESSION_ERROR_CODE(ename),                                         \
                 std::vformat(TXSESSION_ERROR_FMT(ename), std::make_format_args(args...)));        \
  }
#define TXSESSION_DEFINE_ERROR_FMT(ename, evalue, efmt, ...)                                       \
  static const constexpr char* TXSESSION_ERROR_FMT(ename) = efmt;

/// Representation of an error with code, message, and stack trace if available.
///
/// 1. All the error codes and corresponding message formats are listed in
///    TXSESSION_ERROR_CODE_LIST macro.
///
/// 2. Errors should be created using the static factory methods. All factory
///    method names are the same as the error code names. Factory method
///    arguments should match the format string parameters in the
///    TXSESSION_ERROR_CODE_LIST macro.
///
/// 3. Two errors are considered equal if they have the same error code and
///    message.
///
/// Example usage:
///   auto err1 = Error::General("A general error occurred");
///   auto err2 = Error::NotBound("0x7ffd5a1c");
///   auto err3 = std::move(err2);
class Error {
public:
  /// Error codes.
  enum Code : int64_t { TXSESSION_ERROR_CODE_LIST(TXSESSION_DEFINE_ERROR_CODE) };

  /// Returns the error code.
  Code GetCode() const {
    return code_;
  }

  /// Returns the formatted message without code and stack trace.
  const std::string& GetMessage() const {
    return message_;
  }

  /// Returns the string representation of the Error, including stack trace if available.
  std::string ToString() const {
    if (stacktrace_.empty()) {
      return std::format("[ERR-{:03}] {}", static_cast<int64_t>(code_), message_);
    }
    return std::format("[ERR-{:03}] {}\n{}", static_cast<int64_t>(code_), message_, stacktrace_);
  }

  /// Stream output operator for Error.
  friend std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.ToString();
  }

  /// Equality operator for Error.
  bool operator==(const Error& other) const {
    return code_ == other.code_ && message_ == other.message_;
  }

  /// Inequality operator for Error.
  bool operator!=(const Error& other) const {
    return !(*this == other);
  }

  /// Factory methods for creating errors for each error code.
  TXSESSION_ERROR_CODE_LIST(TXSESSION_DEFINE_ERROR_BUILDER);

private:
  /// Make constructor private to enforce usage of factory methods.
  Error(Code code, std::string&& message)
      : code_(code),
        message_(std::move(message)),
#ifdef DEBUG
        stacktrace_(Stacktrace())
#else
        stacktrace_("")
#endif
  {
  }

  /// Message formats for each error code.
  TXSESSION_ERROR_CODE_LIST(TXSESSION_DEFINE_ERROR_FMT);

  Code code_;              // error code.
  std::string message_;    // error message.
  std::string stacktrace_; // stack trace at error creation.
};

/// Whether the error is a failure reported by the persistence engine.
inline bool IsPersistenceError(const Error& error) {
  return error.GetCode() >= Error::Code::kPersistence &&
         error.GetCode() < Error::Code::kUncategorizedDataAccess;
}

/// Whether the error is a translated data access error.
inline bool IsDataAccessError(const Error& error) {
  return error.GetCode() >= Error::Code::kUncategorizedDataAccess && error.GetCode() < 400;
}

#undef TXSESSION_ERROR_CODE_LIST
#undef TXSESSION_ERROR_CODE
#undef TXSESSION_ERROR_FMT
#undef TXSESSION_DEFINE_ERROR_CODE
#undef TXSESSION_DEFINE_ERROR_BUILDER
#undef TXSESSION_DEFINE_ERROR_FMT

} // namespace txsession
