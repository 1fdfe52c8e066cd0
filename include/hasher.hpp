#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "config.hpp"

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace sigmaxfer {

struct FileDigest {
    std::string hex;
    std::uint64_t size_bytes = 0;
};

// Incremental SHA-256. hex() may be called at any point without ending the stream.
class Sha256Accumulator {
   public:
    Sha256Accumulator();

    Sha256Accumulator(const Sha256Accumulator&) = delete;
    Sha256Accumulator& operator=(const Sha256Accumulator&) = delete;

    void update(const void* data, std::size_t size);

    [[nodiscard]] std::string hex() const;
    [[nodiscard]] std::uint64_t bytes() const noexcept { return bytes_; }

   private:
    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> ctx_;
    std::uint64_t bytes_ = 0;
};

class Hasher {
   public:
    // Streams the file through a fixed-size buffer; memory use does not depend on file size.
    static std::expected<FileDigest, std::string> digest_file(
        const std::filesystem::path& path, std::size_t block_size = Config::HASH_BLOCK_SIZE);

    static std::string digest_bytes(std::string_view data);

    // Standard base64 with '=' padding.
    static std::string to_base64(std::span<const unsigned char> data);

    // Interprets `sha256sum` style output: "<digest>  <path>".
    static std::expected<std::string, std::string> parse_remote_digest(std::string_view output);
};

}  // namespace sigmaxfer
