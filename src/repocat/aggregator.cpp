#include "repocat/aggregator.hpp"

#include <format>
#include <ostream>

#include "repocat/errors.hpp"
#include "repocat/logger.hpp"

namespace repocat {

ConsoleProgress::ConsoleProgress(std::ostream& out)
    : out_(out) {}

void ConsoleProgress::file_written(const std::filesystem::path& path) {
    out_ << path.string() << '\n';
}

OutputAggregator::OutputAggregator(std::filesystem::path destination, ProgressReporter& progress)
    : destination_(std::move(destination))
    , out_(destination_, std::ios::binary | std::ios::out | std::ios::trunc)
    , progress_(progress) {
    if (!out_) {
        throw IoError(std::format("failed to create output file '{}'", destination_.string()));
    }
}

void OutputAggregator::append(const std::filesystem::path& source) {
    try {
        write_block(read_block(source));
    } catch (const Error& e) {
        e.rethrow_with_context(std::format("failed to process file '{}'", source.string()));
    }
    Logger::instance().trace("appended {}", source.string());
    progress_.file_written(source);
}

void OutputAggregator::write_block(const Block& block) {
    out_ << block.header << '\n' << block.body << '\n';
    out_.flush();
    if (!out_) {
        throw IoError(std::format("failed to write to '{}'", destination_.string()));
    }
    ++blocks_written_;
}

} // namespace repocat
