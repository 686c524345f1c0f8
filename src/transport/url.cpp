/**
 * @file url.cpp
 * @brief URL parsing and stream endpoint construction
 */

#include <opsdeck_cpp/transport.hpp>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

namespace opsdeck {

Result<Url> parse_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return absl::InvalidArgumentError(absl::StrCat("URL has no scheme: ", url));
    }

    Url out;
    out.scheme = absl::AsciiStrToLower(url.substr(0, scheme_end));
    std::string default_port;
    if (out.scheme == "ws" || out.scheme == "http") {
        default_port = "80";
    } else if (out.scheme == "wss" || out.scheme == "https") {
        default_port = "443";
    } else {
        return absl::InvalidArgumentError(absl::StrCat("Unsupported URL scheme: ", out.scheme));
    }

    auto rest = url.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    auto authority = rest.substr(0, path_start);
    out.target = path_start == std::string::npos ? "/" : rest.substr(path_start);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    } else {
        out.host = authority;
        out.port = default_port;
    }

    if (out.host.empty()) {
        return absl::InvalidArgumentError(absl::StrCat("URL has no host: ", url));
    }
    if (out.port.empty()) {
        out.port = default_port;
    }
    return out;
}

std::string to_websocket_url(const std::string& base_url) {
    std::string url = base_url;
    while (absl::EndsWith(url, "/")) {
        url.pop_back();
    }
    if (absl::StartsWithIgnoreCase(url, "https://")) {
        return absl::StrCat("wss://", url.substr(8));
    }
    if (absl::StartsWithIgnoreCase(url, "http://")) {
        return absl::StrCat("ws://", url.substr(7));
    }
    return url;
}

std::string session_stream_url(const std::string& base_url, const std::string& session_id) {
    return absl::StrCat(to_websocket_url(base_url), "/ws/sessions/", session_id);
}

std::string job_stream_url(const std::string& base_url, const std::string& job_id) {
    return absl::StrCat(to_websocket_url(base_url), "/ws/jobs/", job_id);
}

std::string events_stream_url(const std::string& base_url) {
    return absl::StrCat(to_websocket_url(base_url), "/ws/events");
}

}  // namespace opsdeck
