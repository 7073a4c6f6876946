#include "args_parser.hpp"

#include <CLI/CLI.hpp>

namespace reflux::args_parser {

auto parse_args(int argc, char const* const* argv) -> std::expected<CLIArgs, int> {
    CLIArgs args;
    std::string work_dir;
    std::string lock_name;
    std::string log_level;

    CLI::App app{"Resumable file copy. Without arguments resumes an interrupted session.",
                 "reflux-copy"};

    app.add_option("destination", args.destination, "Target directory");
    app.add_option("sources", args.sources, "Files to copy")->check(CLI::ExistingFile);

    app.add_flag("--verify", args.verify, "Verify every copy with xxHash64");
    auto* work_dir_opt = app.add_option("--work-dir", work_dir, "Directory of the session lock file");
    auto* lock_name_opt = app.add_option("--lock-name", lock_name, "Session name (lock file .<name>.lock)");
    auto* log_level_opt = app.add_option("--log-level", log_level, "trace|debug|info|warn|error|critical|off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return std::unexpected(app.exit(e));
    }

    if (!args.destination.empty() && args.sources.empty()) {
        return std::unexpected(app.exit(CLI::ValidationError("sources", "at least one source file is required")));
    }

    if (work_dir_opt->count() > 0) args.work_dir = work_dir;
    if (lock_name_opt->count() > 0) args.lock_name = lock_name;
    if (log_level_opt->count() > 0) args.log_level = log_level;
    return args;
}

} // namespace reflux::args_parser
