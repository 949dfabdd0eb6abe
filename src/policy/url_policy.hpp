#pragma once

#include <string>
#include <vector>
#include "core/errors/server_errors.hpp"

namespace vidmcp::policy {

struct UrlRules {
    std::vector<std::string> allowed_schemes = {"http", "https"};
};

// Screens URLs before they reach the extractor command line.
class UrlPolicy {
public:
    explicit UrlPolicy(UrlRules rules = {});

    // Returns the trimmed URL. Codes: "empty_url", "invalid_url",
    // "blocked_scheme".
    core::errors::Result<std::string> validate_url(const std::string& url) const;

private:
    static std::string lowercase(std::string value);
    static std::string trim(const std::string& value);

    UrlRules rules_;
};

}  // namespace vidmcp::policy
