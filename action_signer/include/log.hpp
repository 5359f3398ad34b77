#pragma once
#include <string>

// ---- Logging (single lines on stderr, never interleaved across threads) ----

// True when ACTION_SIGNER_DEBUG is set to anything but "" or "0".
// Read once per process.
bool debug_enabled();

// "[tag] msg\n" on stderr under the process-wide log mutex
void log_line(const std::string& tag, const std::string& msg);

// Same as log_line, but only when debug_enabled()
void log_debug(const std::string& tag, const std::string& msg);
