#pragma once

#include <string>

#define CODESTORAGE_VERSION_MAJOR 0
#define CODESTORAGE_VERSION_MINOR 3
#define CODESTORAGE_VERSION_PATCH 0
#define CODESTORAGE_VERSION "0.3.0"

namespace codestorage {

inline constexpr const char* kPackageName = "code-storage-cpp";
inline constexpr const char* kPackageVersion = CODESTORAGE_VERSION;

/**
 * @brief Client identity sent in the Code-Storage-Agent header
 *
 * Format: <product>/<semver>, e.g. "code-storage-cpp/0.3.0"
 */
inline std::string user_agent() {
    return std::string(kPackageName) + "/" + kPackageVersion;
}

} // namespace codestorage
