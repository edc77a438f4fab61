#pragma once

#include <memory>
#include <optional>

#include "repocat/config.hpp"

namespace CLI {
class App;
}

namespace repocat {

class Cli {
public:
    Cli();
    ~Cli();

    // Fills `options` from the command line. Returns an exit code when the
    // program should stop (help, version, usage error). Throws ConfigError
    // or IoError when the selection configuration is invalid.
    [[nodiscard]] std::optional<int> parse(int argc, char** argv, RunOptions& options);

private:
    std::unique_ptr<CLI::App> app_;
};

} // namespace repocat
