#pragma once

#include "txsession/session/error_translator.hpp"
#include "txsession/session/session.hpp"
#include "txsession/tx/resource_holder.hpp"

#include <memory>
#include <utility>

namespace txsession {

/// Binds one live session to the ambient transaction of an execution context.
/// Shared by every caller acquiring a session from the same factory until the
/// transaction completes.
class SessionHandle : public ResourceHolder {
public:
  SessionHandle(std::shared_ptr<Session> session, ExecutorMode executor_mode,
                std::shared_ptr<const ErrorTranslator> translator)
      : session_(std::move(session)),
        executor_mode_(executor_mode),
        translator_(std::move(translator)) {
  }

  const std::shared_ptr<Session>& GetSession() const {
    return session_;
  }

  ExecutorMode GetExecutorMode() const {
    return executor_mode_;
  }

  /// Translator for failures of the deferred commit, may be nullptr.
  const std::shared_ptr<const ErrorTranslator>& GetErrorTranslator() const {
    return translator_;
  }

private:
  const std::shared_ptr<Session> session_;
  const ExecutorMode executor_mode_;
  const std::shared_ptr<const ErrorTranslator> translator_;
};

} // namespace txsession
