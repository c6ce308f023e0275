#pragma once

#include <string>
#include <string_view>

namespace consoleu {

struct Capabilities {
    bool stdout_is_tty = false;
    bool stderr_is_tty = false;
    bool utf8_configured = false;
    bool has_native_unicode_console = false;
    std::string details;
};

// detect_capabilities probes the console once and caches the result.
Capabilities detect_capabilities();

// write_stdout_utf8 writes UTF-8 text (JSON with gimmick names) to stdout,
// through the wide console API where plain writes would garble it.
void write_stdout_utf8(std::string_view utf8);

} // namespace consoleu
