#include "cli.hpp"
#include "b64url/b64url.hpp"
#include <ostream>

namespace b64url::cli {

namespace {
    std::string spelling(const std::string& key) {
        return (key.size() == 1 ? "-" : "--") + key;
    }

    // true if either spelling is present; a flag given a value is a usage error
    bool flagSet(const cmd_args& args, const std::string& longName, const std::string& shortName) {
        bool set = false;
        for (const auto& key : {longName, shortName}) {
            auto value = args.get(key);
            if (!value) continue;
            if (*value != "true") {
                throw UsageError("Option " + spelling(key) + " does not take a value");
            }
            set = true;
        }
        return set;
    }
}

const std::set<std::string>& knownFlags() {
    static const std::set<std::string> flags = {
        "decode", "d", "help", "h", "version", "V"
    };
    return flags;
}

Options parseOptions(const cmd_args& args) {
    for (const auto& [key, value] : args.options) {
        if (knownFlags().count(key) == 0) {
            throw UsageError("Unknown option: " + spelling(key));
        }
    }

    Options opts;
    opts.help = flagSet(args, "help", "h");
    opts.version = flagSet(args, "version", "V");
    if (flagSet(args, "decode", "d")) {
        opts.mode = Mode::Decode;
    }

    if (args.positional.size() > 1) {
        throw UsageError("Unexpected argument: " + args.positional[1] + " (only one FILE allowed)");
    }
    if (!args.positional.empty()) {
        opts.source = Source::fromArgument(args.positional[0]);
    }
    return opts;
}

void printUsage(std::ostream& out) {
    out << PROGRAM_NAME << R"( - Base64 URL-safe encode or decode data (no padding)

Usage: b64url [options] [FILE]

With no FILE, or when FILE is -, read standard input.

Options:
    --decode, -d          Decode data
    --help, -h            Show this help
    --version, -V         Show version

Examples:
    # Encode a file
    b64url image.png > image.b64

    # Decode from standard input
    echo aGVsbG8 | b64url -d
)";
}

int execute(int argc, char* argv[], std::istream& in, std::ostream& out, std::ostream& err) {
    Options opts;
    try {
        opts = parseOptions(cmd_args::parse(argc, argv, knownFlags()));
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << "\n";
        err << "Use --help for usage.\n";
        return EXIT_FAILURE_USAGE;
    }

    if (opts.help) {
        printUsage(out);
        return EXIT_OK;
    }
    if (opts.version) {
        out << PROGRAM_NAME << " " << VERSION << "\n";
        return EXIT_OK;
    }

    try {
        run(opts.mode, opts.source, in, out);
        return EXIT_OK;
    } catch (const Error& e) {
        err << "Error: " << toString(e.kind()) << ": " << e.what() << "\n";
        return EXIT_FAILURE_RUNTIME;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return EXIT_FAILURE_RUNTIME;
    }
}

} // namespace b64url::cli
