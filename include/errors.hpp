#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sigmaxfer {

enum class TransferErrorKind {
    Transport,
    Integrity,
    LocalIo,
};

struct TransferError {
    TransferErrorKind kind = TransferErrorKind::Transport;
    std::string message;
};

std::string_view error_kind_name(TransferErrorKind kind) noexcept;
std::string to_string(const TransferError& err);

// Raised when the secure channel cannot be established. Fatal to a session.
class ConnectionError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

}  // namespace sigmaxfer
