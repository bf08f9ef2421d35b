#include "deviceid/digest.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <iomanip>
#include <memory>
#include <sstream>

namespace deviceid {
namespace digest {

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::ostringstream ss;
    for (uint8_t byte : data) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

Result<std::vector<uint8_t>> sha256(const std::string& input) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::Unknown,
                                                   "Failed to create digest context");
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::Unknown,
                                                   "Failed to initialize SHA-256");
    }

    if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::Unknown, "Failed to hash input");
    }

    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &len) != 1) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::Unknown,
                                                   "Failed to finalize SHA-256");
    }
    hash.resize(len);

    return Result<std::vector<uint8_t>>::ok(std::move(hash));
}

Result<std::string> sha256_hex(const std::string& input) {
    auto hash = sha256(input);
    if (hash.is_error()) {
        return Result<std::string>::error(hash.error_code(), hash.error_message());
    }
    return Result<std::string>::ok(hex_encode(hash.value()));
}

}  // namespace digest
}  // namespace deviceid
