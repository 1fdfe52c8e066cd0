#pragma once

#include <expected>
#include <filesystem>
#include <string>

#include "errors.hpp"

namespace sigmaxfer {

// An already-authenticated connection to one remote host.
class SecureChannel {
   public:
    virtual ~SecureChannel() = default;

    virtual std::expected<void, TransferError> put(const std::filesystem::path& local_path,
                                                   const std::string& remote_path) = 0;

    // Runs a command on the remote host and returns its standard output.
    virtual std::expected<std::string, TransferError> run_command(const std::string& command) = 0;

    // Releases the channel and the underlying connection. Safe to call more than once.
    virtual void close() noexcept = 0;
};

}  // namespace sigmaxfer
