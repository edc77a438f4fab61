#include "repocat/errors.hpp"

#include <string>

namespace repocat {

void Error::rethrow_with_context(std::string_view context) const {
    std::string message{context};
    message += ": ";
    message += what();
    switch (kind_) {
    case Kind::Config:
        throw ConfigError(message);
    case Kind::Acquisition:
        throw AcquisitionError(message);
    case Kind::Io:
        throw IoError(message);
    case Kind::Decode:
        throw DecodeError(message);
    }
    throw Error(kind_, message);
}

std::string_view to_string(Error::Kind kind) noexcept {
    switch (kind) {
    case Error::Kind::Config: return "config error";
    case Error::Kind::Acquisition: return "acquisition error";
    case Error::Kind::Io: return "I/O error";
    case Error::Kind::Decode: return "decode error";
    }
    return "error";
}

} // namespace repocat
