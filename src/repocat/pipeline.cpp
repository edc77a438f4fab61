#include "repocat/pipeline.hpp"

#include <format>
#include <optional>

#include "repocat/errors.hpp"
#include "repocat/logger.hpp"
#include "repocat/perf.hpp"
#include "repocat/selector.hpp"

namespace repocat {

Pipeline::Pipeline(SourceAcquirer& acquirer, ProgressReporter& progress)
    : acquirer_(acquirer)
    , progress_(progress) {}

std::size_t Pipeline::run(const RunOptions& options) {
    auto& logger = Logger::instance();

    // Bad patterns fail before anything is fetched or written.
    SelectionPredicate predicate(options.selection);

    AcquiredSource source = acquirer_.acquire(options.input);
    logger.info("concatenating files under {}", source.root().string());

    ScopedTimer timer("concatenate");
    OutputAggregator aggregator(options.output, progress_);
    FileSelector selector(source.root(), std::move(predicate), options.walk);
    selector.skip_file(options.output);

    while (true) {
        std::optional<std::filesystem::path> path;
        try {
            path = selector.next();
        } catch (const Error& e) {
            e.rethrow_with_context(std::format("failed to walk '{}'", source.root().string()));
        }
        if (!path) {
            break;
        }
        aggregator.append(*path);
    }

    logger.info("wrote {} of {} candidate files to {}", aggregator.blocks_written(), selector.visited_files(),
        options.output.string());
    return aggregator.blocks_written();
}

} // namespace repocat
