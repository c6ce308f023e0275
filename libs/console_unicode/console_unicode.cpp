#include "console_unicode.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>

#if defined(_WIN32)
#include <windows.h>
#include <io.h>
#else
#include <langinfo.h>
#include <locale.h>
#include <unistd.h>
#endif

namespace consoleu {

namespace {

bool equals_ignore_case(const char* a, std::string_view b) {
    if (!a) return false;
    std::string_view av{a};
    if (av.size() != b.size()) return false;
    for (size_t i = 0; i < av.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(av[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

Capabilities detect_capabilities() {
    static const Capabilities cached = []() {
        Capabilities caps;

#if defined(_WIN32)
        caps.stdout_is_tty = _isatty(_fileno(stdout));
        caps.stderr_is_tty = _isatty(_fileno(stderr));
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        DWORD mode = 0;
        bool has_console = hOut != INVALID_HANDLE_VALUE && GetConsoleMode(hOut, &mode);
        caps.has_native_unicode_console = caps.stdout_is_tty && has_console;
        caps.utf8_configured = GetConsoleOutputCP() == 65001;
        std::ostringstream os;
        os << "CP=" << GetConsoleOutputCP()
           << " console=" << (has_console ? "yes" : "no");
        caps.details = os.str();
#else
        caps.stdout_is_tty = isatty(STDOUT_FILENO);
        caps.stderr_is_tty = isatty(STDERR_FILENO);
        setlocale(LC_ALL, "");
        auto codeset = nl_langinfo(CODESET);
        caps.utf8_configured = codeset && equals_ignore_case(codeset, "utf-8");
        auto* term = std::getenv("TERM");
        std::ostringstream os;
        os << "codeset=" << (codeset ? codeset : "unknown")
           << " term=" << (term ? term : "unset");
        caps.details = os.str();
#endif
        return caps;
    }();
    return cached;
}

void write_stdout_utf8(std::string_view utf8) {
#if defined(_WIN32)
    auto caps = detect_capabilities();
    if (caps.has_native_unicode_console) {
        int required = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS,
                                           utf8.data(), static_cast<int>(utf8.size()), nullptr, 0);
        if (required > 0) {
            std::wstring wide(required, 0);
            MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS,
                                utf8.data(), static_cast<int>(utf8.size()),
                                wide.data(), required);
            DWORD written = 0;
            WriteConsoleW(GetStdHandle(STD_OUTPUT_HANDLE), wide.data(),
                          static_cast<DWORD>(wide.size()), &written, nullptr);
            return;
        }
    }
#endif
    std::cout.write(utf8.data(), static_cast<std::streamsize>(utf8.size()));
    std::cout.flush();
}

} // namespace consoleu
