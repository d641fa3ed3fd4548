#pragma once
#include "b64url/dispatch.hpp"
#include "cmd_args.hpp"
#include <iosfwd>
#include <stdexcept>

namespace b64url::cli {

// Exit statuses
inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILURE_RUNTIME = 1;
inline constexpr int EXIT_FAILURE_USAGE = 2;

/// Command line that cannot be turned into Options
class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Validated command line
struct Options {
    Mode mode = Mode::Encode;
    Source source = Source::standardInput();
    bool help = false;
    bool version = false;
};

/// Boolean options understood by the tool, long and short spellings
const std::set<std::string>& knownFlags();

/// Validate parsed arguments
/// @throws UsageError on unknown options, flag values, or more than one FILE
Options parseOptions(const cmd_args& args);

void printUsage(std::ostream& out);

/// Run the tool against the given streams and return the process exit status
int execute(int argc, char* argv[], std::istream& in, std::ostream& out, std::ostream& err);

} // namespace b64url::cli
