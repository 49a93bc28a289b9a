#include "labsync/transfer/checksum.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <vector>

namespace labsync::transfer {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

Result<std::string> md5_file(const std::filesystem::path& path, const CancellationToken& token) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err(ErrorKind::LocalIo, "Cannot open " + path.string());
    }

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return Err(ErrorKind::LocalIo, "MD5 initialisation failed");
    }

    std::vector<char> buffer(1 << 20);
    while (input) {
        if (token.is_canceled()) {
            return Err(ErrorKind::Canceled, "Checksum of " + path.string() + " canceled");
        }
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = input.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
            return Err(ErrorKind::LocalIo, "MD5 update failed for " + path.string());
        }
    }
    if (input.bad()) {
        return Err(ErrorKind::LocalIo, "Cannot read " + path.string());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
        return Err(ErrorKind::LocalIo, "MD5 finalisation failed for " + path.string());
    }

    static const char* hex = "0123456789abcdef";
    std::string text;
    text.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        text += hex[digest[i] >> 4];
        text += hex[digest[i] & 0x0F];
    }
    return Ok(std::move(text));
}

} // namespace labsync::transfer
