#pragma once

#include <string>

// Diagnostic log. Lines go to <tmp>/logtap_debug.log unless redirected;
// forwarded container output never passes through here.
std::string logtap_log_path();

// "" restores the default file, "-" sends diagnostics to stderr.
void set_log_path(const std::string& path);

// Enables logtap_debug() output.
void set_log_verbose(bool verbose);
bool log_verbose();

void logtap_log(const std::string& msg);
void logtap_debug(const std::string& msg);
