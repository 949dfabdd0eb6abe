#include "policy/url_policy.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace vidmcp::policy {

using core::errors::ErrorCategory;
using core::errors::ServerError;

UrlPolicy::UrlPolicy(UrlRules rules) : rules_(std::move(rules)) {}

std::string UrlPolicy::lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string UrlPolicy::trim(const std::string& value) {
    const auto first = std::find_if_not(value.begin(), value.end(), [](const unsigned char c) {
        return std::isspace(c) != 0;
    });
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](const unsigned char c) {
                          return std::isspace(c) != 0;
                      }).base();
    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

core::errors::Result<std::string> UrlPolicy::validate_url(const std::string& url) const {
    const std::string candidate = trim(url);
    if (candidate.empty()) {
        return ServerError{ErrorCategory::Input,
                           "Invalid URL provided. Please provide a valid video URL.",
                           "empty_url"};
    }

    for (const char c : candidate) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) != 0 || std::iscntrl(uc) != 0) {
            return ServerError{ErrorCategory::Input,
                               "URL contains whitespace or control characters.",
                               "invalid_url"};
        }
    }
    if (candidate.front() == '-') {
        return ServerError{ErrorCategory::Input, "URL cannot start with '-'.",
                           "invalid_url"};
    }

    const auto separator = candidate.find("://");
    if (separator == std::string::npos || separator == 0 ||
        separator + 3 >= candidate.size()) {
        return ServerError{ErrorCategory::Input,
                           "URL must look like scheme://host/...: " + candidate,
                           "invalid_url"};
    }

    const std::string scheme = lowercase(candidate.substr(0, separator));
    for (const auto& allowed : rules_.allowed_schemes) {
        if (scheme == lowercase(allowed)) {
            return candidate;
        }
    }
    return ServerError{ErrorCategory::Policy, "URL scheme is not allowed: " + scheme,
                       "blocked_scheme"};
}

}  // namespace vidmcp::policy
