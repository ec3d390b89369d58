#ifndef UPDATE_CHECKER_HPP
#define UPDATE_CHECKER_HPP
#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include "http_client.hpp"
#include "version.hpp"

namespace update {

/** crates.io endpoint describing the published crate. */
inline constexpr const char* REGISTRY_URL = "https://crates.io/api/v1/crates/hazelnut";

/** Result of one version check. Advisory only, never persisted. */
struct VersionCheck {
    enum class Kind { UpToDate, UpdateAvailable, CheckFailed };

    Kind kind = Kind::CheckFailed;
    std::string latest;  ///< Set for UpdateAvailable.
    std::string current; ///< Set for UpdateAvailable.
    std::string reason;  ///< Set for CheckFailed.

    static VersionCheck up_to_date() { return {Kind::UpToDate, "", "", ""}; }
    static VersionCheck available(std::string latest, std::string current) {
        return {Kind::UpdateAvailable, std::move(latest), std::move(current), ""};
    }
    static VersionCheck failed(std::string reason) {
        return {Kind::CheckFailed, "", "", std::move(reason)};
    }
};

using HttpFetcher = std::function<HttpResponse(const std::string& url,
                                               const std::string& user_agent,
                                               std::chrono::milliseconds timeout)>;

/**
 * @brief Compare dotted versions.
 *
 * Anything from the first `-` onward is ignored. Up to three numeric
 * components are compared in order; missing components count as zero and
 * non-numeric ones are dropped.
 *
 * @return `true` only when @p latest is strictly newer than @p current.
 */
bool version_is_newer(const std::string& latest, const std::string& current);

/**
 * @brief Interpret a crates.io crate document.
 *
 * Reads `crate.max_version` and compares it with @p current.
 */
VersionCheck evaluate_registry_response(const std::string& body, const std::string& current);

/**
 * @brief Ask crates.io whether a newer release exists.
 *
 * Issues one GET with a `hazelnut/<version>` user agent. Transport errors,
 * HTTP error statuses and malformed responses all yield a CheckFailed result;
 * this function never throws.
 *
 * @param timeout Upper bound for the whole request; raised to 1ms when smaller.
 * @param fetcher HTTP implementation; http_get() when empty.
 * @param current Version to compare against.
 */
VersionCheck check_for_updates(std::chrono::milliseconds timeout = std::chrono::seconds(5),
                               const HttpFetcher& fetcher = {},
                               const std::string& current = HAZELNUT_VERSION_STR);

} // namespace update

#endif // UPDATE_CHECKER_HPP
