#include "include/errors.hpp"

#include <format>

namespace sigmaxfer {

std::string_view error_kind_name(TransferErrorKind kind) noexcept {
    switch (kind) {
        case TransferErrorKind::Transport:
            return "TransportError";
        case TransferErrorKind::Integrity:
            return "IntegrityFailure";
        case TransferErrorKind::LocalIo:
            return "LocalIoError";
    }
    return "UnknownError";
}

std::string to_string(const TransferError& err) {
    return std::format("{}: {}", error_kind_name(err.kind), err.message);
}

}  // namespace sigmaxfer
