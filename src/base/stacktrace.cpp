#include "txsession/base/stacktrace.hpp"

#include <cpptrace/basic.hpp>

#include <sstream>
#include <string>

namespace txsession {

std::string Stacktrace() {
  std::stringstream ss;
  auto st = cpptrace::stacktrace::current();
  st.print(ss, false);
  return ss.str();
}

} // namespace txsession
