#pragma once

#include <chrono>
#include <string>

namespace yourapi {

/// SDK identification sent on every request.
inline const std::string kSdkVersion  = "0.1.0";
inline const std::string kSdkLanguage = "cpp";

/// Defaults applied when ClientOptions leaves a field unset.
inline constexpr std::chrono::milliseconds kDefaultTimeout{15000};
inline constexpr unsigned int kDefaultMaxRetries = 3;

/// "yourapi-cpp-sdk/<version>"
inline std::string defaultUserAgent() {
    return "yourapi-" + kSdkLanguage + "-sdk/" + kSdkVersion;
}

} // namespace yourapi
