#include "common/txsession_test_suite.hpp"
#include "txsession/base/error.hpp"
#include "txsession/session/error_translator.hpp"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace txsession::test {

class ErrorTranslatorTest : public TxSessionTestSuite {
protected:
  PersistenceErrorTranslator translator_;
};

TEST_F(ErrorTranslatorTest, PersistenceErrorsTranslated) {
  std::vector<std::pair<Error, Error::Code>> cases;
  cases.emplace_back(Error::Persistence("select.user", "io"),
                     Error::Code::kUncategorizedDataAccess);
  cases.emplace_back(Error::PersistenceConstraint("insert.user", "duplicate key"),
                     Error::Code::kDataIntegrityViolation);
  cases.emplace_back(Error::PersistenceGrammar("select.user", "syntax error"),
                     Error::Code::kBadStatementGrammar);
  cases.emplace_back(Error::PersistenceTransient("update.user", "deadlock"),
                     Error::Code::kTransientDataAccess);

  for (const auto& [error, expected] : cases) {
    ASSERT_TRUE(IsPersistenceError(error));
    auto translated = translator_.TranslateIfPossible(error);
    ASSERT_TRUE(translated.has_value()) << error.ToString();
    ASSERT_EQ(translated->GetCode(), expected);
    ASSERT_TRUE(IsDataAccessError(translated.value()));
    // the message of the engine failure is kept
    ASSERT_TRUE(translated->GetMessage().contains(error.GetMessage()));
  }
}

TEST_F(ErrorTranslatorTest, OtherErrorsNotTranslated) {
  ASSERT_FALSE(translator_.TranslateIfPossible(Error::General("engine crashed")).has_value());
  ASSERT_FALSE(translator_.TranslateIfPossible(Error::NoTransaction("MANDATORY")).has_value());
  ASSERT_FALSE(
      translator_.TranslateIfPossible(Error::DataIntegrityViolation("duplicate key")).has_value());
}

} // namespace txsession::test
