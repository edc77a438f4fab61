#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace repocat {

class Error : public std::runtime_error {
public:
    enum class Kind {
        Config,
        Acquisition,
        Io,
        Decode,
    };

    Error(Kind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    // Rethrows as the same concrete error type with "context: " prepended.
    [[noreturn]] void rethrow_with_context(std::string_view context) const;

private:
    Kind kind_;
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(Kind::Config, message) {}
};

class AcquisitionError : public Error {
public:
    explicit AcquisitionError(const std::string& message)
        : Error(Kind::Acquisition, message) {}
};

class IoError : public Error {
public:
    explicit IoError(const std::string& message)
        : Error(Kind::Io, message) {}
};

class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message)
        : Error(Kind::Decode, message) {}
};

[[nodiscard]] std::string_view to_string(Error::Kind kind) noexcept;

} // namespace repocat
