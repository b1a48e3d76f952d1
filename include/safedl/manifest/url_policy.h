#pragma once

#include <safedl/core/types.h>

#include <string>
#include <string_view>
#include <vector>

namespace safedl::manifest {

struct UrlPolicy {
    bool requireHttps{true};
    // Schemes accepted besides https/http (lower-case), e.g. "ftp"
    std::vector<std::string> allowedSchemes;
};

/**
 * @brief Reject URLs the policy does not allow.
 *
 * https is always accepted. http only when requireHttps is false. Any other scheme must be
 * listed in allowedSchemes. Relative URLs are InvalidArgument, refused schemes are
 * PermissionDenied.
 */
Result<void> checkUrlPolicy(std::string_view url, const UrlPolicy& policy);

} // namespace safedl::manifest
