#pragma once

#include <cstddef>

#include "repocat/acquirer.hpp"
#include "repocat/aggregator.hpp"
#include "repocat/config.hpp"

namespace repocat {

// Acquire, select, normalize and write, one file at a time.
class Pipeline {
public:
    Pipeline(SourceAcquirer& acquirer, ProgressReporter& progress);

    // Returns the number of blocks written. The output file is opened only
    // after the source has been acquired; a failure later on leaves the
    // partial output in place.
    std::size_t run(const RunOptions& options);

private:
    SourceAcquirer& acquirer_;
    ProgressReporter& progress_;
};

} // namespace repocat
