#include "lvbtools/lvb.h"
#include "lvbtools/lvbjson.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../common/cli_logger.h"
#include "console_unicode.h"

namespace fs = std::filesystem;
namespace lvb = lvbtools::lvb;
namespace lvbjson = lvbtools::lvbjson;
using json = nlohmann::ordered_json;

struct Settings {
    bool compact = false;
    bool include_bytes = true;
    bool strict = false;
    int verbosity = 0;
};

// load_config reads defaults from a JSON file; flags given on the command
// line override them.
static Settings load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("reading config " + path);
    json j = json::parse(f);
    Settings s;
    if (j.contains("compact")) s.compact = j["compact"].get<bool>();
    if (j.contains("includeBytes")) s.include_bytes = j["includeBytes"].get<bool>();
    if (j.contains("strict")) s.strict = j["strict"].get<bool>();
    if (j.contains("verbosity")) s.verbosity = j["verbosity"].get<int>();
    return s;
}

static std::vector<uint8_t> read_input(const std::string& path) {
    if (path == "-") {
        std::vector<uint8_t> data{std::istreambuf_iterator<char>(std::cin),
                                  std::istreambuf_iterator<char>()};
        if (std::cin.bad()) throw std::runtime_error("failed to read stdin");
        return data;
    }

    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + path);
    std::vector<uint8_t> data{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    if (f.bad()) throw std::runtime_error("failed to read " + path);
    return data;
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static const lvb::Entry* find_gimmick(const lvb::Container& c, const lvbjson::Key& key) {
    if (auto* id = std::get_if<uint32_t>(&key)) return c.gimmick(*id);
    return c.gimmick(std::get<std::string>(key));
}

static const lvb::Entry* find_bdat_gimmick(const lvb::Container& c, const lvbjson::Key& key) {
    if (auto* id = std::get_if<uint32_t>(&key)) return c.bdat_gimmick(*id);
    return nullptr;
}

// run_command builds the JSON document for one command. Throws
// lvb::Error(NotFound) when the requested gimmick or section is absent.
static json run_command(const std::string& command, const lvb::Container& c,
                        const std::vector<std::string>& positional,
                        const lvbjson::JsonOptions& opts) {
    if (command == "full") return lvbjson::to_json(c, opts);

    const std::string& arg = positional[2];
    if (command == "section") {
        const auto* s = c.section(arg);
        if (!s) throw lvb::Error(lvb::ErrorCode::NotFound, "section not found: " + arg);
        return lvbjson::section_json(c, *s, opts);
    }

    auto key = lvbjson::parse_key(arg);
    const lvb::Entry* e = command == "bdat" ? find_bdat_gimmick(c, key) : find_gimmick(c, key);
    if (!e) throw lvb::Error(lvb::ErrorCode::NotFound, "gimmick not found: " + arg);
    return lvbjson::entry_json(c, *e, opts);
}

static void print_usage() {
    lvbtools::cli::print("Usage: lvb_info [flags] <command> <input.lvb|-> [key]");
    lvbtools::cli::print("Decodes LVB gimmick containers and prints JSON to stdout.");
    lvbtools::cli::print("");
    lvbtools::cli::print("Commands:");
    lvbtools::cli::print("  full <file>                  Version and all gimmick sections");
    lvbtools::cli::print("  gimmick <file> <name|<HEX>>  One gimmick by name (legacy) or hash id");
    lvbtools::cli::print("  bdat <file> <<HEX>>          One gimmick by bdat id (version 5+)");
    lvbtools::cli::print("  section <file> <MAGIC>       One gimmick section");
    lvbtools::cli::print("Ids are written as 8 uppercase hex digits in angle brackets, e.g. <0012AB34>.");
    lvbtools::cli::print("");
    lvbtools::cli::print("Flags:");
    lvbtools::cli::print("  --compact        Single-line JSON");
    lvbtools::cli::print("  --no-bytes       Omit raw entry bytes");
    lvbtools::cli::print("  --strict         Fail on duplicate sections and unreadable names");
    lvbtools::cli::print("  --config <file>  Read defaults from a JSON file");
    lvbtools::cli::print("  -v, --verbose    Enable verbose logging");
    lvbtools::cli::print("  -vv, --debug     Enable debug logging");
}

int main(int argc, char* argv[]) {
    std::optional<bool> compact;
    std::optional<bool> no_bytes;
    std::optional<bool> strict;
    std::optional<int> verbosity;
    std::string config_path;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--compact") == 0) {
            compact = true;
        } else if (std::strcmp(argv[i], "--no-bytes") == 0) {
            no_bytes = true;
        } else if (std::strcmp(argv[i], "--strict") == 0) {
            strict = true;
        } else if (std::strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                LOGE("--config needs a file path");
                return 1;
            }
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(verbosity.value_or(0) + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else {
            positional.push_back(argv[i]);
        }
    }

    Settings settings;
    if (!config_path.empty()) {
        try {
            settings = load_config(config_path);
        } catch (const std::exception& e) {
            LOGE("config:", e.what());
            return 1;
        }
    }
    if (compact) settings.compact = *compact;
    if (no_bytes) settings.include_bytes = false;
    if (strict) settings.strict = *strict;
    if (verbosity) settings.verbosity = *verbosity;

    lvbtools::cli::set_verbosity(settings.verbosity);

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    std::string command = to_lower(positional[0]);
    size_t needed = 0;
    if (command == "full") needed = 2;
    else if (command == "gimmick" || command == "bdat" || command == "section") needed = 3;
    else {
        LOGE("unknown command", positional[0]);
        print_usage();
        return 1;
    }
    if (positional.size() < needed) {
        LOGE("missing arguments for", command);
        print_usage();
        return 1;
    }

    const std::string& input_path = positional[1];
    std::string filename = input_path == "-" ? "stdin" : fs::path(input_path).filename().string();
    LOGI("Reading", input_path == "-" ? "stdin" : input_path);

    std::vector<uint8_t> data;
    try {
        data = read_input(input_path);
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }
    LOGD("Input size (bytes):", data.size());

    lvb::Container container;
    try {
        container = lvb::read(data, lvb::Options{.strict = settings.strict});
    } catch (const std::exception& e) {
        LOGE("parsing", filename, e.what());
        return 1;
    }

    for (const auto& w : container.warnings())
        LOGW(filename + ":", lvb::to_string(w.code), w.message);

    LOGI("Version:", container.version(), container.modern() ? "(modern)" : "(legacy)");
    LOGI("Sections:", container.sections().size(), "Gimmicks:", container.gimmick_count());
    if (lvbtools::cli::debug_enabled()) {
        for (const auto& s : container.sections()) {
            lvbtools::cli::debug("Section", s.magic, "offset", s.offset, "size", s.size,
                                 "entries", s.entries.size(), "mapper", lvb::to_string(s.mapper));
        }
    }

    std::string out;
    try {
        json doc = run_command(command, container, positional,
                               lvbjson::JsonOptions{.include_bytes = settings.include_bytes});
        out = lvbjson::dump(doc, settings.compact ? -1 : 1);
    } catch (const std::exception& e) {
        LOGE(e.what());
        return 1;
    }
    out += '\n';
    consoleu::write_stdout_utf8(out);
    return 0;
}
