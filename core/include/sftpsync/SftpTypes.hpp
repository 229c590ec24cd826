// Basic types shared between the transport and the sync runtime.
// Kept as plain structs so they can be copied across threads freely.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sftpsync {

// known_hosts validation policy for the server key.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: accepts and records new hosts; rejects key changes.
    Off        // No verification.
};

struct FileInfo {
    std::string name; // base name
    bool is_dir = false;
    std::uint64_t size = 0;  // bytes
    std::uint64_t mtime = 0; // epoch seconds
    std::uint32_t mode = 0;  // POSIX bits (permissions/type)
};

// Answers keyboard-interactive prompts. Must return true and fill one response
// per prompt; on false the backend falls back to user/password heuristics.
using KbdIntPromptsCB = std::function<bool(const std::string &name,
                                           const std::string &instruction,
                                           const std::vector<std::string> &prompts,
                                           std::vector<std::string> &responses)>;

// Receives a chunk of remote command output.
using ExecOutputCB = std::function<void(const std::string &chunk)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Fingerprint confirmation (TOFU) when known_hosts has no entry.
    // When unset, AcceptNew trusts the key on first use.
    std::function<bool(const std::string &host, std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)>
        hostkey_confirm_cb;

    KbdIntPromptsCB keyboard_interactive_cb;

    // TCP connect + handshake + authentication budget.
    int connect_timeout_ms = 20000;
    // Budget for every individual call once connected.
    int operation_timeout_ms = 30000;
};

} // namespace sftpsync
