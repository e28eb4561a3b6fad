#pragma once
#include "commands.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace cronkit {

struct Config;

struct ParsedArgs {
    std::vector<std::string> positional;
    AssocArgs assoc;
    bool help = false;
};

// Split argv (without the program name) into positional and --key=value
// arguments. A bare --flag has the value "true".
ParsedArgs parse_args(const std::vector<std::string>& args);

// Move --store, --store-path and --site-url from assoc into config
void apply_global_options(AssocArgs& assoc, Config& config);

// Route a command line (leading "cron" optional) to its handler
CommandResult dispatch(const ParsedArgs& parsed, CommandContext& ctx);

std::string usage_text();

// Full run: load config, open the store, execute, print. Returns exit status.
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace cronkit
