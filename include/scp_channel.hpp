#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "secure_channel.hpp"
#include "ssh_context.hpp"

typedef void CURL;
struct ssh_session_struct;

namespace sigmaxfer {

struct ChannelOptions {
    std::string host;
    int port = Config::SSH_DEFAULT_PORT;
    std::string username;
    std::filesystem::path key_path;
    std::optional<long> bandwidth_limit_kbps;
    std::chrono::seconds socket_timeout{Config::SOCKET_TIMEOUT_SEC};
    std::filesystem::path known_hosts;
};

// scp:// URL for a remote path. Relative and "~/" paths resolve against the login directory.
std::string scp_url(const std::string& host, int port, std::string_view remote_path);

// SSH channel: libssh carries the authenticated session and remote commands,
// libcurl pushes file content over scp:// with the configured rate ceiling.
class ScpChannel final : public SecureChannel {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

   public:
    ScpChannel(PrivateTag, ChannelOptions options);

    // Connects and authenticates. Throws ConnectionError on failure.
    static std::unique_ptr<ScpChannel> open(const ChannelOptions& options);

    ~ScpChannel() override;

    ScpChannel(const ScpChannel&) = delete;
    ScpChannel& operator=(const ScpChannel&) = delete;

    std::expected<void, TransferError> put(const std::filesystem::path& local_path,
                                           const std::string& remote_path) override;

    std::expected<std::string, TransferError> run_command(const std::string& command) override;

    void close() noexcept override;

    [[nodiscard]] bool is_open() const noexcept { return session_ != nullptr; }

   private:
    void connect();

    static size_t read_file(char* buffer, size_t size, size_t nitems, std::ifstream* in) noexcept;

    SshContext context_;
    ChannelOptions options_;
    // Base64 SHA-256 of the server key seen by libssh; curl must see the same key.
    std::string host_key_sha256_;
    std::unique_ptr<ssh_session_struct, void (*)(ssh_session_struct*)> session_;
    std::unique_ptr<CURL, void (*)(CURL*)> curl_;
};

}  // namespace sigmaxfer
