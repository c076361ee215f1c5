#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace yourapi {

/// Error codes produced by the SDK itself. Server-supplied codes are passed
/// through unchanged.
namespace errc {
inline const std::string kParseError         = "PARSE_ERROR";
inline const std::string kRequestError       = "REQUEST_ERROR";
inline const std::string kMaxRetriesExceeded = "MAX_RETRIES_EXCEEDED";
inline const std::string kCancelled          = "CANCELLED";
} // namespace errc

/// Structured failure thrown for every non-success outcome of a request.
///
/// what() renders the message followed by "(status=..)", "(code=..)" and
/// "(request_id=..)" for whichever of those are present.
class APIError : public std::runtime_error {
public:
    explicit APIError(std::string message,
                      std::optional<unsigned int> status    = std::nullopt,
                      std::optional<std::string>  code      = std::nullopt,
                      std::optional<nlohmann::json> details = std::nullopt,
                      std::optional<std::string>  requestId = std::nullopt);

    const std::string&                   message()   const { return mMessage; }
    const std::optional<unsigned int>&   status()    const { return mStatus; }
    const std::optional<std::string>&    code()      const { return mCode; }
    const std::optional<nlohmann::json>& details()   const { return mDetails; }
    const std::optional<std::string>&    requestId() const { return mRequestId; }

    bool hasCode(const std::string& code) const {
        return mCode.has_value() && *mCode == code;
    }

private:
    std::string                   mMessage;
    std::optional<unsigned int>   mStatus;
    std::optional<std::string>    mCode;
    std::optional<nlohmann::json> mDetails;
    std::optional<std::string>    mRequestId;
};

/// Format the user-visible rendering used by APIError::what().
std::string formatApiError(const std::string& message,
                           const std::optional<unsigned int>& status,
                           const std::optional<std::string>& code,
                           const std::optional<std::string>& requestId);

} // namespace yourapi
