#pragma once

#include <string>

namespace txsession {

/// Returns the stack trace of the calling thread.
std::string Stacktrace();

} // namespace txsession
