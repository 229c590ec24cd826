// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Every call runs in blocking mode bounded by the libssh2 session timeout;
// exec() switches to non-blocking mode to multiplex stdout and stderr.
#include "sftpsync/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace sftpsync {

namespace {

std::once_flag g_libssh2_init;

// keyboard-interactive context: answers user and password depending on prompt
struct KbdIntCtx {
    const char *user;
    const char *pass;
    const KbdIntPromptsCB *cb; // optional prompt handler
};

char *dupResponse(const char *data, std::size_t len) {
    char *buf = static_cast<char *>(std::malloc(len + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, data, len);
    buf[len] = '\0';
    return buf;
}

void kbint_password_callback(const char *name, int name_len,
                             const char *instruction, int instruction_len,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                             void **abstract) {
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);

    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> ptxts;
        ptxts.reserve(static_cast<std::size_t>(num_prompts));
        for (int i = 0; i < num_prompts; ++i) {
            const char *pt = (prompts && prompts[i].text)
                                 ? reinterpret_cast<const char *>(prompts[i].text)
                                 : "";
            ptxts.emplace_back(pt);
        }
        std::vector<std::string> answers;
        std::string nm = (name && name_len > 0)
                             ? std::string(name, static_cast<std::size_t>(name_len))
                             : std::string();
        std::string ins =
            (instruction && instruction_len > 0)
                ? std::string(instruction, static_cast<std::size_t>(instruction_len))
                : std::string();
        if ((*(ctx->cb))(nm, ins, ptxts, answers) &&
            static_cast<int>(answers.size()) >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i) {
                const std::string &a = answers[static_cast<std::size_t>(i)];
                responses[i].text = a.empty() ? nullptr : dupResponse(a.data(), a.size());
                responses[i].length =
                    responses[i].text ? static_cast<unsigned int>(a.size()) : 0;
            }
            return;
        }
        // the handler could not answer; fall back to the simple heuristic
    }
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text)
                                 ? std::string(reinterpret_cast<const char *>(prompts[i].text),
                                               prompts[i].length)
                                 : std::string();
        for (char &c : prompt)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        // Prompts mentioning "user" or "name" get the username, anything else
        // the password.
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char *ans = wantUser ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        if (alen == 0) {
            responses[i].text = nullptr;
            responses[i].length = 0;
            continue;
        }
        responses[i].text = dupResponse(ans, alen);
        responses[i].length = responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

std::string hostKeyAlgorithmName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "DSA";
#ifdef LIBSSH2_HOSTKEY_TYPE_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ECDSA-521";
#endif
#ifdef LIBSSH2_HOSTKEY_TYPE_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ED25519";
#endif
    default:
        return "UNKNOWN";
    }
}

int knownHostKeyBits(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

std::string fingerprint(LIBSSH2_SESSION *session) {
    const unsigned char *h = reinterpret_cast<const unsigned char *>(
        libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256));
    if (!h)
        return {};
    std::ostringstream oss;
    oss << "SHA256:";
    for (int i = 0; i < 32; ++i) {
        if (i)
            oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_init, []() { (void)libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() { disconnect(); }

bool Libssh2SftpClient::tcpConnect(const std::string &host, uint16_t port,
                                   int timeoutMs, std::string &err) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect so the attempt honours the connect budget.
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd {};
            pfd.fd = s;
            pfd.events = POLLOUT;
            rc = ::poll(&pfd, 1, timeoutMs);
            if (rc == 1) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len);
                rc = soErr == 0 ? 0 : -1;
            } else {
                err = rc == 0 ? "connect timed out" : "poll failed";
                rc = -1;
            }
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            sock_.store(s);
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    if (err.empty())
        err = "Could not connect to host/port.";
    return false;
}

std::string Libssh2SftpClient::failure(const std::string &what) {
    if (!session_)
        return what;
    char *emsg = nullptr;
    int emlen = 0;
    const int code = libssh2_session_last_error(session_, &emsg, &emlen, 0);
    if (code == LIBSSH2_ERROR_TIMEOUT)
        return what + ": operation timed out";
    if (code == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        code == LIBSSH2_ERROR_SOCKET_SEND || code == LIBSSH2_ERROR_SOCKET_RECV ||
        code == LIBSSH2_ERROR_SOCKET_TIMEOUT) {
        connected_.store(false);
    }
    if (emsg && emlen > 0)
        return what + ": " + std::string(emsg, static_cast<std::size_t>(emlen));
    return what;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions &opt, std::string &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char *home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(),
                                              LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not obtain host key";
        return false;
    }

    const int alg = knownHostKeyBits(keytype);
    const int typemask_plain =
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash =
        LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost *host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey,
                                         keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port, hostkey,
                                         keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        const bool confirmed =
            opt.hostkey_confirm_cb
                ? opt.hostkey_confirm_cb(opt.host, opt.port,
                                         hostKeyAlgorithmName(keytype),
                                         fingerprint(session_))
                : true;
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err = "Unknown host: fingerprint not confirmed";
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path is not defined";
            return false;
        }
        const int addMask =
            LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        const int addrc =
            libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr, hostkey, keylen,
                                   nullptr, 0, addMask, nullptr);
        if (addrc != 0 || libssh2_knownhost_writefile(
                              nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not record host in known_hosts";
            return false;
        }
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key does not match known_hosts"
              : "Host unknown in known_hosts";
    return false;
}

bool Libssh2SftpClient::tryAgentAuth(const SessionOptions &opt) {
    bool authed = false;
    LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0 &&
        libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey *identity = nullptr;
        struct libssh2_agent_publickey *prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3;
        while (tries < kMaxAgentTries &&
               libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            if (libssh2_agent_userauth(agent, opt.username.c_str(), identity) == 0) {
                authed = true;
                break;
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

// Authentication prefers the explicit method configured by the user:
// 1) private key when one is set;
// 2) password, then keyboard-interactive if the server offers it;
// 3) ssh-agent as the last resort.
bool Libssh2SftpClient::authenticate(const SessionOptions &opt, std::string &err) {
    if (opt.private_key_path.has_value()) {
        const char *passphrase =
            opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(
            session_, opt.username.c_str(), nullptr, opt.private_key_path->c_str(),
            passphrase);
        if (rc == 0)
            return true;
        if (!opt.password.has_value()) {
            err = failure("Key authentication failed");
            return false;
        }
    }

    auto authList = [&]() {
        char *methods = libssh2_userauth_list(
            session_, opt.username.c_str(),
            static_cast<unsigned>(opt.username.size()));
        return methods ? std::string(methods) : std::string();
    };

    if (opt.password.has_value()) {
        int rc_pw = libssh2_userauth_password(session_, opt.username.c_str(),
                                              opt.password->c_str());
        if (rc_pw == 0)
            return true;
        if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
            rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after the password attempt";
            return false;
        }
        const std::string methods = authList();
        if (methods.find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str(),
                          &opt.keyboard_interactive_cb};
            void **abs = libssh2_session_abstract(session_);
            if (abs)
                *abs = &ctx;
            int rc_kbd = libssh2_userauth_keyboard_interactive(
                session_, opt.username.c_str(), kbint_password_callback);
            if (abs)
                *abs = nullptr;
            if (rc_kbd == 0)
                return true;
        }
        if (methods.find("publickey") != std::string::npos && tryAgentAuth(opt))
            return true;
        err = failure("Password/keyboard-interactive authentication failed") +
              (methods.empty() ? std::string() : " (methods: " + methods + ")");
        return false;
    }

    const std::string methods = authList();
    if (methods.find("publickey") != std::string::npos && tryAgentAuth(opt))
        return true;
    err = "No credentials: key/agent/password unavailable";
    return false;
}

bool Libssh2SftpClient::connect(const SessionOptions &opt, std::string &err) {
    if (connected_.load()) {
        err = "Already connected";
        return false;
    }
    operationTimeoutMs_ = opt.operation_timeout_ms;
    if (!tcpConnect(opt.host, opt.port, opt.connect_timeout_ms, err))
        return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.connect_timeout_ms);

    if (libssh2_session_handshake(session_, sock_.load()) != 0) {
        err = failure("SSH handshake failed");
        disconnect();
        return false;
    }
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = failure("Could not initialize SFTP");
        disconnect();
        return false;
    }

    libssh2_session_set_timeout(session_, operationTimeoutMs_);
    connected_.store(true);
    return true;
}

void Libssh2SftpClient::interrupt() {
    connected_.store(false);
    const int s = sock_.load();
    if (s != -1)
        ::shutdown(s, SHUT_RDWR);
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    const int s = sock_.exchange(-1);
    if (s != -1)
        ::close(s);
    connected_.store(false);
}

bool Libssh2SftpClient::list(const std::string &remote_path,
                             std::vector<FileInfo> &out, std::string &err) {
    if (!connected_.load() || !sftp_) {
        err = "Not connected";
        return false;
    }

    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = failure("sftp_opendir failed for " + path);
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            FileInfo fi{};
            fi.name = std::string(filename, static_cast<std::size_t>(rc));
            if (fi.name == "." || fi.name == "..")
                continue;
            fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                            ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) ==
                               LIBSSH2_SFTP_S_IFDIR)
                            : false;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
                fi.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
                fi.mtime = attrs.mtime;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                fi.mode = static_cast<std::uint32_t>(attrs.permissions);
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break;
        } else {
            err = failure("sftp_readdir_ex failed");
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::stat(const std::string &remote_path, FileInfo &info,
                             std::string &err) {
    if (!connected_.load() || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                                  static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
            if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE ||
                sftp_err == LIBSSH2_FX_NO_SUCH_PATH) {
                err.clear();
                return false; // does not exist
            }
        }
        err = failure("remote stat failed");
        return false;
    }
    info.name.clear();
    info.is_dir = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                      ? ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                      : false;
    info.size = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? st.filesize : 0;
    info.mtime = (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) ? st.mtime : 0;
    info.mode = (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                    ? static_cast<std::uint32_t>(st.permissions)
                    : 0;
    return true;
}

// Downloads a remote file. Reports progress and honours cooperative
// cancellation between chunks.
bool Libssh2SftpClient::get(const std::string &remote, const std::string &local,
                            std::string &err, ProgressCB progress,
                            CancelCB shouldCancel) {
    if (!connected_.load() || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err = failure("Could not stat remote file");
        return false;
    }
    const std::size_t total =
        (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? static_cast<std::size_t>(st.filesize) : 0;

    LIBSSH2_SFTP_HANDLE *rh =
        libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
                             LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = failure("Could not open remote file for reading");
        return false;
    }

    FILE *lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err = "Could not open local file for writing";
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;
    bool ok = true;

    while (true) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled";
            ok = false;
            break;
        }
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) !=
                static_cast<std::size_t>(n)) {
                err = "Local write failed";
                ok = false;
                break;
            }
            done += static_cast<std::size_t>(n);
            if (progress && total)
                progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            err = failure("Remote read failed");
            ok = false;
            break;
        }
    }

    if (std::fclose(lf) != 0 && ok) {
        err = "Local write failed";
        ok = false;
    }
    libssh2_sftp_close(rh);
    return ok;
}

// Uploads a local file (create/truncate). Reports progress and cancellation.
bool Libssh2SftpClient::put(const std::string &local, const std::string &remote,
                            std::string &err, ProgressCB progress,
                            CancelCB shouldCancel) {
    if (!connected_.load() || !sftp_) {
        err = "Not connected";
        return false;
    }

    FILE *lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading";
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    const long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);
    const std::size_t total = fsz > 0 ? static_cast<std::size_t>(fsz) : 0;

    const unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
    LIBSSH2_SFTP_HANDLE *wh =
        libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
                             flags, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = failure("Could not open remote file for writing");
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;
    bool ok = true;

    while (ok) {
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err = "Local read failed";
                ok = false;
            }
            break; // EOF
        }
        const char *p = buf.data();
        std::size_t remain = n;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                err = "Cancelled";
                ok = false;
                break;
            }
            ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                err = failure("Remote write failed");
                ok = false;
                break;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
            done += static_cast<std::size_t>(w);
            if (progress && total)
                progress(done, total);
        }
    }

    if (libssh2_sftp_close(wh) != 0 && ok) {
        err = failure("Remote close failed");
        ok = false;
    }
    std::fclose(lf);
    return ok;
}

bool Libssh2SftpClient::mkdir(const std::string &remote_dir, std::string &err,
                              unsigned int mode) {
    if (!connected_.load() || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), static_cast<long>(mode)) != 0) {
        err = failure("sftp_mkdir failed for " + remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string &remote_path, std::string &err) {
    if (!connected_.load() || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        err = failure("sftp_unlink failed for " + remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string &from, const std::string &to,
                               std::string &err, bool overwrite) {
    if (!connected_.load() || !sftp_) {
        err = "Not connected";
        return false;
    }
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite)
        flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    int rc = libssh2_sftp_rename_ex(sftp_, from.c_str(), static_cast<unsigned>(from.size()),
                                    to.c_str(), static_cast<unsigned>(to.size()), flags);
    if (rc != 0) {
        err = failure("sftp_rename_ex failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::setTimes(const std::string &remote_path, std::uint64_t atime,
                                 std::uint64_t mtime, std::string &err) {
    if (!connected_.load() || !sftp_) {
        err = "Not connected";
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
    a.atime = static_cast<unsigned long>(atime);
    a.mtime = static_cast<unsigned long>(mtime);
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                                  static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_SETSTAT, &a);
    if (rc != 0) {
        err = failure("remote setTimes failed");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::waitSocket(int timeoutMs) {
    const int s = sock_.load();
    if (s == -1)
        return false;
    struct pollfd pfd {};
    pfd.fd = s;
    const int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
        pfd.events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
        pfd.events |= POLLOUT;
    if (pfd.events == 0)
        pfd.events = POLLIN;
    return ::poll(&pfd, 1, timeoutMs) >= 0;
}

bool Libssh2SftpClient::exec(const std::string &command, const ExecOutputCB &onStdout,
                             const ExecOutputCB &onStderr, int &exitCode,
                             std::string &err, CancelCB shouldCancel) {
    exitCode = -1;
    if (!connected_.load() || !session_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_CHANNEL *channel = libssh2_channel_open_session(session_);
    if (!channel) {
        err = failure("Could not open exec channel");
        return false;
    }
    if (libssh2_channel_exec(channel, command.c_str()) != 0) {
        err = failure("channel exec failed");
        libssh2_channel_free(channel);
        return false;
    }

    // Non-blocking while draining both streams so neither can stall the other.
    libssh2_session_set_blocking(session_, 0);
    std::vector<char> buf(16 * 1024);
    bool ok = true;
    const auto idleLimit = std::chrono::milliseconds(operationTimeoutMs_);
    auto lastActivity = std::chrono::steady_clock::now();

    while (true) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelled";
            ok = false;
            break;
        }
        bool progressed = false;
        ssize_t n = libssh2_channel_read(channel, buf.data(), buf.size());
        if (n > 0) {
            if (onStdout)
                onStdout(std::string(buf.data(), static_cast<std::size_t>(n)));
            progressed = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            err = failure("channel read failed");
            ok = false;
            break;
        }
        n = libssh2_channel_read_stderr(channel, buf.data(), buf.size());
        if (n > 0) {
            if (onStderr)
                onStderr(std::string(buf.data(), static_cast<std::size_t>(n)));
            progressed = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            err = failure("channel stderr read failed");
            ok = false;
            break;
        }
        if (progressed) {
            lastActivity = std::chrono::steady_clock::now();
            continue;
        }
        if (libssh2_channel_eof(channel))
            break;
        if (std::chrono::steady_clock::now() - lastActivity > idleLimit) {
            err = "Remote command: operation timed out";
            ok = false;
            break;
        }
        if (!waitSocket(100)) {
            err = "socket wait failed";
            connected_.store(false);
            ok = false;
            break;
        }
    }

    libssh2_session_set_blocking(session_, 1);
    if (ok && libssh2_channel_close(channel) == 0) {
        (void)libssh2_channel_wait_closed(channel);
        exitCode = libssh2_channel_get_exit_status(channel);
    }
    libssh2_channel_free(channel);
    return ok;
}

} // namespace sftpsync
