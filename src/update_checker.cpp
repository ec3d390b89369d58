#include "update_checker.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace update {

namespace {

// Components must fit in 32 bits; larger or non-numeric pieces are skipped.
std::vector<unsigned long long> parse_components(const std::string& version) {
    std::string base = version.substr(0, version.find('-'));
    std::vector<unsigned long long> parts;
    std::istringstream in(base);
    std::string piece;
    while (std::getline(in, piece, '.')) {
        if (piece.empty())
            continue;
        bool digits = true;
        for (unsigned char c : piece)
            digits = digits && std::isdigit(c);
        if (!digits)
            continue;
        unsigned long long value = 0;
        try {
            value = std::stoull(piece);
        } catch (const std::out_of_range&) {
            continue;
        }
        if (value > UINT32_MAX)
            continue;
        parts.push_back(value);
    }
    return parts;
}

} // namespace

bool version_is_newer(const std::string& latest, const std::string& current) {
    auto l = parse_components(latest);
    auto c = parse_components(current);
    for (size_t i = 0; i < 3; ++i) {
        unsigned long long lv = i < l.size() ? l[i] : 0;
        unsigned long long cv = i < c.size() ? c[i] : 0;
        if (lv > cv)
            return true;
        if (lv < cv)
            return false;
    }
    return false;
}

VersionCheck evaluate_registry_response(const std::string& body, const std::string& current) {
    nlohmann::json root = nlohmann::json::parse(body, nullptr, false);
    if (root.is_discarded())
        return VersionCheck::failed("Failed to parse response: invalid JSON");
    // {"crate": {"max_version": "1.2.3", ...}}
    if (!root.is_object() || !root.contains("crate") || !root["crate"].is_object())
        return VersionCheck::failed("Could not parse crates.io response");
    const auto& krate = root["crate"];
    auto it = krate.find("max_version");
    if (it == krate.end() || !it->is_string())
        return VersionCheck::failed("Could not parse crates.io response");
    std::string latest = it->get<std::string>();
    if (version_is_newer(latest, current))
        return VersionCheck::available(latest, current);
    return VersionCheck::up_to_date();
}

VersionCheck check_for_updates(std::chrono::milliseconds timeout, const HttpFetcher& fetcher,
                               const std::string& current) {
    const std::string agent = std::string("hazelnut/") + current;
    // A zero timeout means "never" to libcurl.
    timeout = std::max(timeout, std::chrono::milliseconds(1));
    HttpResponse resp = fetcher ? fetcher(REGISTRY_URL, agent, timeout)
                                : http_get(REGISTRY_URL, agent, timeout);
    if (!resp.ok) {
        log_warning("Update check failed", {{"reason", resp.error}});
        return VersionCheck::failed("Request failed: " + resp.error);
    }
    if (resp.status >= 400) {
        log_warning("Update check failed", {{"status", std::to_string(resp.status)}});
        return VersionCheck::failed("Request failed: HTTP status " + std::to_string(resp.status));
    }
    VersionCheck result = evaluate_registry_response(resp.body, current);
    if (result.kind == VersionCheck::Kind::UpdateAvailable)
        log_info("Update available", {{"latest", result.latest}, {"current", result.current}});
    else if (result.kind == VersionCheck::Kind::CheckFailed)
        log_warning("Update check failed", {{"reason", result.reason}});
    return result;
}

} // namespace update
