#include "include/hasher.hpp"

#include <array>
#include <format>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>

#include "include/file_descriptor.hpp"
#include "include/utils.hpp"

namespace sigmaxfer {

namespace {

std::string to_hex(const unsigned char* data, std::size_t len) {
    static constexpr std::string_view digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(digits[(data[i] >> 4) & 0xF]);
        out.push_back(digits[data[i] & 0xF]);
    }
    return out;
}

}  // namespace

Sha256Accumulator::Sha256Accumulator() : ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free) {
    if (!ctx_) {
        throw std::runtime_error("Failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }
}

void Sha256Accumulator::update(const void* data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
    bytes_ += size;
}

std::string Sha256Accumulator::hex() const {
    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> copy(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!copy || EVP_MD_CTX_copy_ex(copy.get(), ctx_.get()) != 1) {
        throw std::runtime_error("Failed to copy digest context");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(copy.get(), md.data(), &md_len) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }
    return to_hex(md.data(), md_len);
}

std::expected<FileDigest, std::string> Hasher::digest_file(const std::filesystem::path& path,
                                                           std::size_t block_size) {
    auto fd = FileDescriptor::open_read(path);
    if (!fd) {
        return std::unexpected(fd.error());
    }

    Sha256Accumulator acc;
    std::vector<char> buffer(block_size == 0 ? Config::HASH_BLOCK_SIZE : block_size);

    while (true) {
        auto n = fd->read_some(buffer.data(), buffer.size());
        if (!n) {
            return std::unexpected(std::format("{}: {}", path.string(), n.error()));
        }
        if (*n == 0) {
            break;
        }
        acc.update(buffer.data(), *n);
    }

    return FileDigest{acc.hex(), acc.bytes()};
}

std::string Hasher::digest_bytes(std::string_view data) {
    Sha256Accumulator acc;
    acc.update(data.data(), data.size());
    return acc.hex();
}

std::string Hasher::to_base64(std::span<const unsigned char> data) {
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), data.data(), static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n));
}

std::expected<std::string, std::string> Hasher::parse_remote_digest(std::string_view output) {
    auto token = first_token(output);
    if (token.empty()) {
        return std::unexpected("empty remote digest");
    }

    std::string digest = to_lower(token);
    if (digest.size() != Config::SHA256_HEX_LENGTH || !is_hex_string(digest)) {
        return std::unexpected(std::format("malformed remote digest '{}'", token));
    }
    return digest;
}

}  // namespace sigmaxfer
