#pragma once

#include <string_view>

#ifndef REPOCAT_VERSION_MAJOR
#define REPOCAT_VERSION_MAJOR 0
#endif

#ifndef REPOCAT_VERSION_MINOR
#define REPOCAT_VERSION_MINOR 0
#endif

#ifndef REPOCAT_VERSION_PATCH
#define REPOCAT_VERSION_PATCH 0
#endif

#ifndef REPOCAT_VERSION_STRING
#define REPOCAT_VERSION_STRING "0.0.0"
#endif

namespace repocat {

class Version {
public:
    static constexpr int major() noexcept { return REPOCAT_VERSION_MAJOR; }
    static constexpr int minor() noexcept { return REPOCAT_VERSION_MINOR; }
    static constexpr int patch() noexcept { return REPOCAT_VERSION_PATCH; }

    static constexpr std::string_view string() noexcept { return std::string_view{REPOCAT_VERSION_STRING}; }
};

} // namespace repocat
