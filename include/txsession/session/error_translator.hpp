#pragma once

#include "txsession/base/error.hpp"

#include <optional>

namespace txsession {

/// Translates failures of the persistence engine into data access errors.
class ErrorTranslator {
public:
  virtual ~ErrorTranslator() = default;

  /// Returns the translated error, or std::nullopt when the error is not
  /// recognized and should be propagated as is.
  virtual std::optional<Error> TranslateIfPossible(const Error& error) const = 0;
};

/// Maps every persistence error to its data access counterpart:
///
///   Persistence           -> UncategorizedDataAccess
///   PersistenceConstraint -> DataIntegrityViolation
///   PersistenceGrammar    -> BadStatementGrammar
///   PersistenceTransient  -> TransientDataAccess
///
/// Any other error is left untranslated.
class PersistenceErrorTranslator : public ErrorTranslator {
public:
  std::optional<Error> TranslateIfPossible(const Error& error) const override;
};

} // namespace txsession
