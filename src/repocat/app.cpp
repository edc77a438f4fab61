#include "repocat/app.hpp"

#include <exception>
#include <iostream>

#include "repocat/acquirer.hpp"
#include "repocat/aggregator.hpp"
#include "repocat/cli.hpp"
#include "repocat/config.hpp"
#include "repocat/errors.hpp"
#include "repocat/logger.hpp"
#include "repocat/pipeline.hpp"

namespace repocat {

App::App() = default;

int App::run(int argc, char** argv) {
    try {
        Cli cli;
        RunOptions options;
        if (auto code = cli.parse(argc, argv, options)) {
            return *code;
        }

        auto acquirer = SourceAcquirer::with_default_fetchers();
        ConsoleProgress progress(std::cout);
        Pipeline pipeline(acquirer, progress);
        pipeline.run(options);

        std::cout << "All text files have been concatenated into '" << options.output.string() << "'\n";
        return 0;
    } catch (const Error& e) {
        Logger::instance().debug("run aborted with {}", to_string(e.kind()));
        std::cerr << "repocat: error: " << e.what() << '\n';
    } catch (const std::exception& e) {
        std::cerr << "repocat: error: " << e.what() << '\n';
    }
    return 1;
}

} // namespace repocat
