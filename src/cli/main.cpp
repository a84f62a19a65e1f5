// ctext command-line tool: strip comments, dump tokens, list macro calls.
#include <ctext/config.hpp>
#include <ctext/lang/macro.hpp>
#include <ctext/lang/scanner.hpp>
#include <ctext/lang/strip.hpp>
#include <ctext/log.hpp>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace ctext;

namespace {

const char* kMainUsage =
    "Usage: ctext [options] <command> [command options] [source file]\n"
    "\n"
    "Commands:\n"
    "    strip     strip comments from a C source file\n"
    "    tokens    print the comment and text tokens of a C source file\n"
    "    macros    list invocations of function-like macros\n"
    "    help      show help for a command\n"
    "\n"
    "Options:\n"
    "    --config PATH     read settings from PATH (after ~/.ctext/config.toml)\n"
    "    --max-buffer N    fail on any token larger than N bytes (0 = no limit)\n"
    "    -v, --verbose     log debug messages\n"
    "    -q, --quiet       log errors only\n"
    "    --color, --no-color\n"
    "\n"
    "The source is read from stdin when no file is given.\n";

const char* kStripUsage =
    "usage: ctext strip [-l] [-o output] [source file]\n"
    "\n"
    "Strip comments from a C source file, or from stdin. The result is written\n"
    "to the -o file, or to stdout. With -l (--keep-lines) each removed comment\n"
    "leaves its newlines behind so line numbers are unchanged.\n";

const char* kTokensUsage =
    "usage: ctext tokens [source file]\n"
    "\n"
    "Print one line per token: position, token type and quoted text.\n";

const char* kMacrosUsage =
    "usage: ctext macros -n NAME [-n NAME ...] [source file]\n"
    "\n"
    "List every call of the named function-like macros, one per line, as\n"
    "START-END: NAME( args );. Names may be glob patterns such as 'LOG_*'.\n"
    "Names listed under [macros] in the configuration are included.\n";

struct Options {
    std::string config_path;
    std::optional<size_t> max_buffer;
    std::optional<log::Level> level;
    std::optional<bool> color;

    std::string command;
    std::string input;
    std::string output;
    bool keep_lines = false;
    std::vector<std::string> names;
};

// Go-style quoting of token text
std::string quote(const std::string& s) {
    std::string out = "\"";
    for (unsigned char c : s) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        default:
            if (c < 0x20 || c == 0x7f) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                out += buf;
            } else {
                out += static_cast<char>(c);
            }
        }
    }
    out += "\"";
    return out;
}

Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    std::vector<std::string> args(argv + 1, argv + argc);

    auto need_value = [&](size_t& i) -> Result<std::string> {
        if (i + 1 >= args.size()) {
            return CtextError{CtextError::InvalidArg,
                "option " + args[i] + " requires a value"};
        }
        return Result<std::string>::ok(args[++i]);
    };

    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--config") {
            auto v = need_value(i);
            CTEXT_TRY(v);
            opts.config_path = v.value();
        } else if (a == "--max-buffer") {
            auto v = need_value(i);
            CTEXT_TRY(v);
            auto n = parse_size(v.value(), "--max-buffer");
            CTEXT_TRY(n);
            opts.max_buffer = n.value();
        } else if (a == "-v" || a == "--verbose") {
            opts.level = log::Debug;
        } else if (a == "-q" || a == "--quiet") {
            opts.level = log::Error;
        } else if (a == "--color") {
            opts.color = true;
        } else if (a == "--no-color") {
            opts.color = false;
        } else if (!a.empty() && a[0] == '-') {
            return CtextError{CtextError::InvalidArg, "unknown option " + a,
                "run 'ctext help' for usage"};
        } else {
            break;
        }
    }

    if (i == args.size()) {
        return CtextError{CtextError::InvalidArg, "no command given",
            "run 'ctext help' for usage"};
    }
    opts.command = args[i++];

    std::vector<std::string> positional;
    for (; i < args.size(); ++i) {
        const std::string& a = args[i];
        if ((a == "-o" || a == "--output") && opts.command == "strip") {
            auto v = need_value(i);
            CTEXT_TRY(v);
            opts.output = v.value();
        } else if ((a == "-l" || a == "--keep-lines") && opts.command == "strip") {
            opts.keep_lines = true;
        } else if ((a == "-n" || a == "--name") && opts.command == "macros") {
            auto v = need_value(i);
            CTEXT_TRY(v);
            opts.names.push_back(v.value());
        } else if (a.size() > 1 && a[0] == '-') {
            return CtextError{CtextError::InvalidArg,
                "unknown option " + a + " for command '" + opts.command + "'",
                "run 'ctext help " + opts.command + "' for usage"};
        } else {
            positional.push_back(a);
        }
    }

    if (positional.size() > 1 && opts.command != "help") {
        return CtextError{CtextError::InvalidArg, "expected a single input file"};
    }
    if (!positional.empty()) opts.input = positional[0];

    return Result<Options>::ok(std::move(opts));
}

// Global config first, then --config, then flags
Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string gpath = global_config_path();
    if (!gpath.empty() && std::ifstream(gpath).good()) {
        auto g = Config::load(gpath);
        CTEXT_TRY(g);
        global = std::move(g).value();
    }

    std::optional<Config> local;
    if (!opts.config_path.empty()) {
        auto l = Config::load(opts.config_path);
        CTEXT_TRY(l);
        local = std::move(l).value();
    }

    Config cfg = Config::effective(global, local);
    if (opts.max_buffer) cfg.max_buffer = *opts.max_buffer;
    if (opts.level) cfg.log_level = *opts.level;
    if (opts.color) {
        cfg.log_color = *opts.color;
        cfg.log_color_set = true;
    }
    return Result<Config>::ok(std::move(cfg));
}

// An empty path leaves file closed and the input is read from stdin
Status open_input(const std::string& path, std::ifstream& file) {
    if (path.empty()) return ok_status();
    file.open(path, std::ios::binary);
    if (!file.is_open()) {
        return CtextError{CtextError::IO,
            "cannot open input file: " + path,
            "check that the file exists and is readable"};
    }
    return ok_status();
}

std::istream& input_stream(std::ifstream& file) {
    if (file.is_open()) return file;
    return std::cin;
}

Status run_strip(const Options& opts, const Config& cfg) {
    std::ifstream file;
    CTEXT_TRY(open_input(opts.input, file));

    StripOptions strip;
    strip.filename = opts.input;
    strip.max_buffer = cfg.max_buffer;
    strip.keep_lines = opts.keep_lines;

    if (opts.output.empty()) {
        return strip_comments(std::cout, input_stream(file), strip);
    }

    std::ofstream out(opts.output, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return CtextError{CtextError::IO, "cannot open output file: " + opts.output};
    }
    return strip_comments(out, input_stream(file), strip);
}

Status run_tokens(const Options& opts, const Config& cfg) {
    std::ifstream file;
    CTEXT_TRY(open_input(opts.input, file));

    Scanner scanner(input_stream(file), opts.input);
    scanner.set_max_buffer(cfg.max_buffer);

    size_t count = 0;
    TokenType tt;
    while ((tt = scanner.next()) != TokenType::Error) {
        std::cout << scanner.token().pos.str() << ": " << token_type_name(tt)
                  << " " << quote(scanner.token_text()) << "\n";
        ++count;
    }
    if (!scanner.at_eof()) return scanner.error();

    log::debug("%zu tokens", count);
    return ok_status();
}

Status run_macros(const Options& opts, const Config& cfg) {
    std::vector<std::string> raw = cfg.macro_names;
    raw.insert(raw.end(), opts.names.begin(), opts.names.end());
    if (raw.empty()) {
        return CtextError{CtextError::InvalidArg, "no macro names given",
            "pass -n NAME or list names under [macros] in the config"};
    }

    auto names = NameSet::create(raw);
    CTEXT_TRY(names);

    std::ifstream file;
    CTEXT_TRY(open_input(opts.input, file));

    ScanOptions scan;
    scan.filename = opts.input;
    scan.max_buffer = cfg.max_buffer;

    return scan_invocations(input_stream(file), names.value(),
        [](const Invocation& inv) {
            std::cout << inv.start_line << "-" << inv.end_line << ": "
                      << inv.str() << "\n";
        }, scan);
}

int run_help(const Options& opts) {
    if (opts.input == "strip") {
        std::cerr << kStripUsage;
    } else if (opts.input == "tokens") {
        std::cerr << kTokensUsage;
    } else if (opts.input == "macros") {
        std::cerr << kMacrosUsage;
    } else {
        std::cerr << kMainUsage;
    }
    return 1;
}

} // anonymous namespace

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        log::error("%s", opts.error().format().c_str());
        std::cerr << kMainUsage;
        return 1;
    }
    const Options& o = opts.value();

    if (o.command == "help") {
        return run_help(o);
    }

    auto cfg = load_config(o);
    if (cfg.is_err()) {
        log::error("%s", cfg.error().format().c_str());
        return 1;
    }
    log::set_level(cfg.value().log_level);
    if (cfg.value().log_color_set) log::set_color_enabled(cfg.value().log_color);

    Status st = ok_status();
    if (o.command == "strip") {
        st = run_strip(o, cfg.value());
    } else if (o.command == "tokens") {
        st = run_tokens(o, cfg.value());
    } else if (o.command == "macros") {
        st = run_macros(o, cfg.value());
    } else {
        log::error("unknown command \"%s\"", o.command.c_str());
        std::cerr << "Run 'ctext help' for usage.\n";
        return 1;
    }

    std::cout.flush();
    if (st.is_err()) {
        log::error("%s", st.error().format().c_str());
        return 1;
    }
    return 0;
}
