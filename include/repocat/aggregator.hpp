#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iosfwd>

#include "repocat/normalizer.hpp"

namespace repocat {

class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;
    virtual void file_written(const std::filesystem::path& path) = 0;
};

// Prints each written path on its own line.
class ConsoleProgress : public ProgressReporter {
public:
    explicit ConsoleProgress(std::ostream& out);

    void file_written(const std::filesystem::path& path) override;

private:
    std::ostream& out_;
};

// Sole owner of the output stream. Blocks are flushed one at a time.
class OutputAggregator {
public:
    // Creates or truncates `destination`; throws IoError on failure.
    OutputAggregator(std::filesystem::path destination, ProgressReporter& progress);

    OutputAggregator(const OutputAggregator&) = delete;
    OutputAggregator& operator=(const OutputAggregator&) = delete;

    // Normalizes `source` and writes its block. Errors carry the file as context.
    void append(const std::filesystem::path& source);

    void write_block(const Block& block);

    [[nodiscard]] std::size_t blocks_written() const noexcept { return blocks_written_; }

private:
    std::filesystem::path destination_;
    std::ofstream out_;
    ProgressReporter& progress_;
    std::size_t blocks_written_ { 0 };
};

} // namespace repocat
