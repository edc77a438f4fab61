#include "repocat/cli.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <string>

#include "repocat/errors.hpp"
#include "repocat/logger.hpp"
#include "repocat/version.hpp"

namespace repocat {

namespace {
constexpr const char* kDescription =
    "repocat - flatten a local directory or remote git repository into one text file";

struct CliState {
    std::string input;
    std::string output{std::string{kDefaultOutputFile}};
    std::string config_path;
    std::string include;
    std::string exclude;
    std::string log_level{"error"};
    bool hidden{false};
    bool no_ignore{false};
};
} // namespace

Cli::Cli() = default;

Cli::~Cli() = default;

std::optional<int> Cli::parse(int argc, char** argv, RunOptions& options) {
    CliState state{};
    app_ = std::make_unique<CLI::App>(kDescription);

    app_->set_version_flag("-V,--version", "repocat version " + std::string{Version::string()});

    app_->add_option("-i,--input", state.input, "GitHub/GitLab/Bitbucket repository URL or local folder path")
        ->type_name("SOURCE")
        ->required();
    app_->add_option("-o,--output", state.output, "Output file name")
        ->type_name("PATH")
        ->default_str(std::string{kDefaultOutputFile});
    auto* config_option = app_->add_option("-c,--config", state.config_path,
        "JSON config listing allowed file extensions (extension mode)")
        ->type_name("PATH")
        ->check(CLI::ExistingFile);
    auto* include_option = app_->add_option("--include", state.include,
        "Comma-separated glob patterns a path must match")
        ->type_name("GLOBS");
    auto* exclude_option = app_->add_option("--exclude", state.exclude,
        "Comma-separated glob patterns that reject a path")
        ->type_name("GLOBS");

    app_->add_flag("--hidden", state.hidden, "Also walk hidden files and directories");
    app_->add_flag("--no-ignore", state.no_ignore, "Do not honor .gitignore and .ignore files");
    app_->add_option("-v,--log-level", state.log_level, "Set log verbosity (error, warn, info, debug, trace)")
        ->type_name("LEVEL")
        ->default_str("error");

    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    auto level = parse_log_level(state.log_level);
    if (!level) {
        throw ConfigError("invalid log level: " + state.log_level);
    }
    Logger::instance().set_level(*level);

    const bool glob_options = include_option->count() > 0 || exclude_option->count() > 0;
    if (config_option->count() > 0 && glob_options) {
        throw ConfigError("--config selects extension mode and cannot be combined with --include/--exclude");
    }

    options.input = state.input;
    options.output = std::filesystem::path(state.output);
    options.walk.skip_hidden = !state.hidden;
    options.walk.honor_ignore_files = !state.no_ignore;
    if (config_option->count() > 0) {
        options.selection = load_extension_config(state.config_path);
    } else {
        options.selection = glob_selection(state.include, state.exclude);
    }
    return std::nullopt;
}

} // namespace repocat
