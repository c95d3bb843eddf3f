#pragma once

#include <string>

namespace voiceflow {

// Append-only diagnostic log. The host application has no console, so every
// diagnostic from the library ends up here.
//
// Each call opens the file, appends "[<unix seconds>] <message>" and closes it.
// Failures are ignored: logging never fails a request.
// The file is not rotated or capped.
void debugLog(const char* message) noexcept;
void debugLog(const std::string& message) noexcept;

// Fixed location of the log file.
const char* debugLogPath() noexcept;

} // namespace voiceflow
