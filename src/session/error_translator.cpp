#include "txsession/session/error_translator.hpp"

#include "txsession/base/error.hpp"

#include <optional>

namespace txsession {

std::optional<Error> PersistenceErrorTranslator::TranslateIfPossible(const Error& error) const {
  switch (error.GetCode()) {
  case Error::Code::kPersistence:
    return Error::UncategorizedDataAccess(error.GetMessage());
  case Error::Code::kPersistenceConstraint:
    return Error::DataIntegrityViolation(error.GetMessage());
  case Error::Code::kPersistenceGrammar:
    return Error::BadStatementGrammar(error.GetMessage());
  case Error::Code::kPersistenceTransient:
    return Error::TransientDataAccess(error.GetMessage());
  default:
    return std::nullopt;
  }
}

} // namespace txsession
