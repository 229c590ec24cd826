// Redaction policy for log lines that would otherwise carry user identities
// or remote paths. Sensitive values are shown only in a dev environment with
// SFTPSYNC_LOG_SENSITIVE switched on.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace sftpsync {

// Lowercased, whitespace-trimmed value of an environment variable.
inline std::string envValue(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    std::string v(raw);
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    v.erase(v.begin(), std::find_if(v.begin(), v.end(), notSpace));
    v.erase(std::find_if(v.rbegin(), v.rend(), notSpace).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

inline bool sensitiveLoggingEnabled() {
    const std::string env = envValue("SFTPSYNC_ENV");
    const bool dev = env == "dev" || env == "development" || env == "local";
    if (!dev)
        return false;
    const std::string flag = envValue("SFTPSYNC_LOG_SENSITIVE");
    return flag == "1" || flag == "true" || flag == "yes" || flag == "on";
}

// user@host:port with the user masked.
inline std::string redactedTarget(const std::string &user, const std::string &host,
                                  unsigned port) {
    const std::string who = sensitiveLoggingEnabled() ? user : std::string("***");
    return who + "@" + host + ":" + std::to_string(port);
}

// Keeps only the last path segment of a remote path.
inline std::string redactedPath(const std::string &path) {
    if (sensitiveLoggingEnabled())
        return path;
    const std::size_t slash = path.find_last_of('/');
    if (slash == std::string::npos || slash + 1 >= path.size())
        return path.empty() ? path : std::string(".../");
    return ".../" + path.substr(slash + 1);
}

} // namespace sftpsync
