#include "include/scp_channel.hpp"

#include <array>
#include <cerrno>
#include <format>
#include <string_view>
#include <system_error>
#include <utility>

#include <curl/curl.h>
#include <libssh/libssh.h>

#include "include/hasher.hpp"
#include "include/utils.hpp"

namespace sigmaxfer {

namespace {

void free_session(ssh_session_struct* session) {
    if (session) {
        if (ssh_is_connected(session)) {
            ssh_disconnect(session);
        }
        ssh_free(session);
    }
}

void free_curl(CURL* handle) {
    if (handle) curl_easy_cleanup(handle);
}

struct ChannelDeleter {
    void operator()(ssh_channel_struct* ch) const noexcept {
        if (ch) {
            ssh_channel_close(ch);
            ssh_channel_free(ch);
        }
    }
};

struct KeyDeleter {
    void operator()(ssh_key_struct* key) const noexcept {
        if (key) ssh_key_free(key);
    }
};

struct CurlStringDeleter {
    void operator()(char* s) const noexcept {
        if (s) curl_free(s);
    }
};

std::string ssh_error_text(ssh_session session) {
    if (!session) return "libssh: null session";
    return ssh_get_error(session);
}

TransferError transport_error(std::string message) {
    return TransferError{TransferErrorKind::Transport, std::move(message)};
}

// Unknown hosts are trusted and recorded; a changed key is rejected.
int accept_new_host_key(CURL*, const struct curl_khkey*, const struct curl_khkey*,
                        enum curl_khmatch match, void*) {
    switch (match) {
        case CURLKHMATCH_OK:
            return CURLKHSTAT_FINE;
        case CURLKHMATCH_MISSING:
            return CURLKHSTAT_FINE_ADD_TO_FILE;
        default:
            return CURLKHSTAT_REJECT;
    }
}

}  // namespace

std::string scp_url(const std::string& host, int port, std::string_view remote_path) {
    std::string escaped;
    std::string_view rest = remote_path;
    bool absolute = rest.starts_with('/');
    if (absolute) {
        rest.remove_prefix(1);
    } else if (rest.starts_with("~/")) {
        rest.remove_prefix(2);
    }

    while (!rest.empty()) {
        auto slash = rest.find('/');
        std::string_view segment = rest.substr(0, slash);
        std::unique_ptr<char, CurlStringDeleter> enc(
            curl_easy_escape(nullptr, segment.data(), static_cast<int>(segment.size())));
        escaped += enc ? enc.get() : std::string(segment);
        if (slash == std::string_view::npos) break;
        escaped.push_back('/');
        rest.remove_prefix(slash + 1);
    }

    // scp:// paths are absolute; "~" anchors the rest at the login directory.
    return std::format("scp://{}:{}/{}{}", host, port, absolute ? "" : "~/", escaped);
}

ScpChannel::ScpChannel(PrivateTag, ChannelOptions options)
    : options_(std::move(options)),
      session_(nullptr, free_session),
      curl_(curl_easy_init(), free_curl) {
    if (!curl_) throw ConnectionError("Failed to create curl handle");
}

ScpChannel::~ScpChannel() {
    close();
}

std::unique_ptr<ScpChannel> ScpChannel::open(const ChannelOptions& options) {
    if (options.host.empty()) throw ConnectionError("No host specified");
    if (options.username.empty()) throw ConnectionError("No user specified");

    auto channel = std::make_unique<ScpChannel>(PrivateTag{}, options);
    channel->connect();
    return channel;
}

void ScpChannel::connect() {
    session_.reset(ssh_new());
    ssh_session s = session_.get();
    if (!s) {
        throw ConnectionError("ssh_new() failed");
    }

    auto fail = [&](std::string_view what) {
        std::string msg = std::format("{} ({}@{}:{}): {}",
                                      what, options_.username, options_.host, options_.port,
                                      ssh_error_text(s));
        session_.reset();
        throw ConnectionError(msg);
    };

    long timeout = options_.socket_timeout.count();
    if (ssh_options_set(s, SSH_OPTIONS_HOST, options_.host.c_str()) != SSH_OK ||
        ssh_options_set(s, SSH_OPTIONS_USER, options_.username.c_str()) != SSH_OK ||
        ssh_options_set(s, SSH_OPTIONS_PORT, &options_.port) != SSH_OK ||
        ssh_options_set(s, SSH_OPTIONS_TIMEOUT, &timeout) != SSH_OK) {
        fail("ssh_options_set failed");
    }

    if (!options_.known_hosts.empty() &&
        ssh_options_set(s, SSH_OPTIONS_KNOWNHOSTS, options_.known_hosts.c_str()) != SSH_OK) {
        fail("Cannot use known hosts file");
    }

    if (ssh_connect(s) != SSH_OK) {
        fail("ssh_connect failed");
    }

    switch (ssh_session_is_known_server(s)) {
        case SSH_KNOWN_HOSTS_OK:
            break;
        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            fail("Host key verification failed");
            break;
        case SSH_KNOWN_HOSTS_UNKNOWN:
        case SSH_KNOWN_HOSTS_NOT_FOUND:
            if (!options_.known_hosts.empty() && ssh_session_update_known_hosts(s) != SSH_OK) {
                fail("Cannot record host key");
            }
            break;
        case SSH_KNOWN_HOSTS_ERROR:
            fail("Host key lookup failed");
            break;
    }

    // Uploads open their own connection through curl; pin it to this key.
    ssh_key raw_server_key = nullptr;
    if (ssh_get_server_publickey(s, &raw_server_key) != SSH_OK) {
        fail("Cannot read server host key");
    }
    std::unique_ptr<ssh_key_struct, KeyDeleter> server_key(raw_server_key);
    unsigned char* hash = nullptr;
    size_t hash_len = 0;
    if (ssh_get_publickey_hash(server_key.get(), SSH_PUBLICKEY_HASH_SHA256, &hash, &hash_len) != SSH_OK) {
        fail("Cannot hash server host key");
    }
    host_key_sha256_ = Hasher::to_base64({hash, hash_len});
    ssh_clean_pubkey_hash(&hash);

    int rc = SSH_AUTH_DENIED;
    if (!options_.key_path.empty()) {
        ssh_key raw_key = nullptr;
        if (ssh_pki_import_privkey_file(options_.key_path.c_str(), nullptr, nullptr, nullptr,
                                        &raw_key) != SSH_OK) {
            session_.reset();
            throw ConnectionError(
                std::format("Cannot load private key '{}'", options_.key_path.string()));
        }
        std::unique_ptr<ssh_key_struct, KeyDeleter> key(raw_key);
        rc = ssh_userauth_publickey(s, nullptr, key.get());
    }

    if (rc != SSH_AUTH_SUCCESS) {
        rc = ssh_userauth_publickey_auto(s, nullptr, nullptr);
    }

    if (rc != SSH_AUTH_SUCCESS) {
        fail("Public-key auth failed");
    }
}

size_t ScpChannel::read_file(char* buffer, size_t size, size_t nitems, std::ifstream* in) noexcept {
    in->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (in->bad()) return CURL_READFUNC_ABORT;
    return static_cast<size_t>(in->gcount());
}

std::expected<void, TransferError> ScpChannel::put(const std::filesystem::path& local_path,
                                                   const std::string& remote_path) {
    if (!session_ || !curl_) {
        return std::unexpected(transport_error("channel is closed"));
    }
    if (host_key_sha256_.empty()) {
        return std::unexpected(transport_error("server host key was never pinned"));
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(local_path, ec);
    if (ec) {
        return std::unexpected(TransferError{
            TransferErrorKind::LocalIo,
            std::format("Cannot stat '{}': {}", local_path.string(), ec.message())});
    }

    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        return std::unexpected(TransferError{
            TransferErrorKind::LocalIo,
            std::format("Cannot read '{}': {}", local_path.string(),
                        std::system_category().message(errno))});
    }

    CURL* h = curl_.get();
    curl_easy_reset(h);

    const std::string url = scp_url(options_.host, options_.port, remote_path);
    const std::string key = options_.key_path.string();
    const std::string known_hosts = options_.known_hosts.string();

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(h, CURLOPT_READFUNCTION, read_file);
    curl_easy_setopt(h, CURLOPT_READDATA, &in);
    curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
    curl_easy_setopt(h, CURLOPT_USERNAME, options_.username.c_str());
    curl_easy_setopt(h, CURLOPT_SSH_AUTH_TYPES, static_cast<long>(CURLSSH_AUTH_PUBLICKEY));
    if (!key.empty()) {
        curl_easy_setopt(h, CURLOPT_SSH_PRIVATE_KEYFILE, key.c_str());
    }
    if (CURLcode pin = curl_easy_setopt(h, CURLOPT_SSH_HOST_PUBLIC_KEY_SHA256, host_key_sha256_.c_str());
        pin != CURLE_OK) {
        return std::unexpected(transport_error(
            std::format("Cannot pin SSH host key for upload: {}", curl_easy_strerror(pin))));
    }
    if (!known_hosts.empty()) {
        curl_easy_setopt(h, CURLOPT_SSH_KNOWNHOSTS, known_hosts.c_str());
        curl_easy_setopt(h, CURLOPT_SSH_KEYFUNCTION, accept_new_host_key);
    }

    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, Config::CONNECT_TIMEOUT_SEC);
    // Idle timeout: abort when nothing moves for socket_timeout seconds.
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.socket_timeout.count()));
    if (options_.bandwidth_limit_kbps && *options_.bandwidth_limit_kbps > 0) {
        curl_easy_setopt(h, CURLOPT_MAX_SEND_SPEED_LARGE,
                         static_cast<curl_off_t>(*options_.bandwidth_limit_kbps) * 1024);
    }
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(h);
    if (res != CURLE_OK) {
        return std::unexpected(
            transport_error(std::format("Upload to '{}' failed: {}", remote_path, curl_easy_strerror(res))));
    }
    return {};
}

std::expected<std::string, TransferError> ScpChannel::run_command(const std::string& command) {
    ssh_session s = session_.get();
    if (!s) {
        return std::unexpected(transport_error("channel is closed"));
    }

    std::unique_ptr<ssh_channel_struct, ChannelDeleter> ch(ssh_channel_new(s));
    if (!ch) {
        return std::unexpected(transport_error("ssh_channel_new failed"));
    }

    if (ssh_channel_open_session(ch.get()) != SSH_OK) {
        return std::unexpected(
            transport_error(std::format("ssh_channel_open_session failed: {}", ssh_error_text(s))));
    }

    if (ssh_channel_request_exec(ch.get(), command.c_str()) != SSH_OK) {
        return std::unexpected(transport_error(
            std::format("exec '{}' failed: {}", command, ssh_error_text(s))));
    }

    const int timeout_ms = static_cast<int>(options_.socket_timeout.count() * 1000);
    std::string out;
    std::string err;
    std::array<char, 4096> buf;

    auto drain = [&](std::string& dest, int is_stderr) -> std::expected<void, TransferError> {
        while (true) {
            int n = ssh_channel_read_timeout(ch.get(), buf.data(), static_cast<uint32_t>(buf.size()),
                                             is_stderr, timeout_ms);
            if (n == SSH_ERROR) {
                return std::unexpected(
                    transport_error(std::format("read from '{}' failed: {}", command, ssh_error_text(s))));
            }
            if (n == 0) {
                if (ssh_channel_is_eof(ch.get()) || ssh_channel_is_closed(ch.get())) return {};
                return std::unexpected(transport_error(std::format("'{}' timed out", command)));
            }
            if (dest.size() + static_cast<std::size_t>(n) > Config::MAX_COMMAND_OUTPUT) {
                return std::unexpected(transport_error("remote output too large"));
            }
            dest.append(buf.data(), static_cast<std::size_t>(n));
        }
    };

    if (auto r = drain(out, 0); !r) return std::unexpected(r.error());
    if (auto r = drain(err, 1); !r) return std::unexpected(r.error());

    ssh_channel_send_eof(ch.get());

    int status = ssh_channel_get_exit_status(ch.get());
    if (status != 0) {
        std::string detail = trim(err);
        if (detail.empty()) detail = trim(out);
        return std::unexpected(transport_error(
            std::format("'{}' exited with status {}: {}", command, status, detail)));
    }

    return out;
}

void ScpChannel::close() noexcept {
    curl_.reset();
    session_.reset();
}

}  // namespace sigmaxfer
