#include "api_error.hpp"

#include <sstream>
#include <utility>

namespace yourapi {

std::string formatApiError(const std::string& message,
                           const std::optional<unsigned int>& status,
                           const std::optional<std::string>& code,
                           const std::optional<std::string>& requestId)
{
    std::ostringstream out;
    out << message;
    if (status)    out << " (status=" << *status << ")";
    if (code)      out << " (code=" << *code << ")";
    if (requestId) out << " (request_id=" << *requestId << ")";
    return out.str();
}

APIError::APIError(std::string message,
                   std::optional<unsigned int> status,
                   std::optional<std::string> code,
                   std::optional<nlohmann::json> details,
                   std::optional<std::string> requestId)
    : std::runtime_error(formatApiError(message, status, code, requestId))
    , mMessage(std::move(message))
    , mStatus(status)
    , mCode(std::move(code))
    , mDetails(std::move(details))
    , mRequestId(std::move(requestId))
{}

} // namespace yourapi
