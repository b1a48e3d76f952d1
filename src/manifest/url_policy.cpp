#include <safedl/downloader/downloader.hpp>
#include <safedl/manifest/url_policy.h>

#include <algorithm>

namespace safedl::manifest {

Result<void> checkUrlPolicy(std::string_view url, const UrlPolicy& policy) {
    if (!downloader::isAbsoluteUrl(url)) {
        return Error{ErrorCode::InvalidArgument, "URL must be absolute: '" + std::string(url) +
                                                     "'"};
    }
    const auto scheme = downloader::urlScheme(url);
    if (scheme == "https") {
        return Result<void>();
    }
    if (scheme == "http") {
        if (policy.requireHttps) {
            return Error{ErrorCode::PermissionDenied,
                         "plain http is refused (HTTPS required): " + std::string(url)};
        }
        return Result<void>();
    }
    if (std::find(policy.allowedSchemes.begin(), policy.allowedSchemes.end(), scheme) !=
        policy.allowedSchemes.end()) {
        return Result<void>();
    }
    return Error{ErrorCode::PermissionDenied, "scheme '" + scheme + "' is not allowed"};
}

} // namespace safedl::manifest
