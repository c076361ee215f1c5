#include "transport.hpp"

#include <boost/beast/core/string.hpp>

#include <algorithm>

namespace yourapi {

const char* toString(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Patch:  return "PATCH";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

void HeaderMap::set(const std::string& name, const std::string& value) {
    auto it = std::find_if(mEntries.begin(), mEntries.end(),
                           [&](const Entry& e) {
                               return boost::beast::iequals(e.first, name);
                           });
    if (it != mEntries.end()) {
        it->second = value;
    } else {
        mEntries.emplace_back(name, value);
    }
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    for (const auto& e : mEntries) {
        if (boost::beast::iequals(e.first, name)) {
            return e.second;
        }
    }
    return std::nullopt;
}

bool HeaderMap::contains(const std::string& name) const {
    return get(name).has_value();
}

} // namespace yourapi
