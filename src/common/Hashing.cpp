#include "../../include/aeo_engine/common/Hashing.h"
#include "../../include/aeo_engine/common/Errors.h"

#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>

namespace aeo_engine::common {

namespace {
const char* const kAiScorePrefix = "ai_score:";
const char* const kPartSeparator = "||";
}

std::string sha256Hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw AeoError("Failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw AeoError("SHA-256 digest computation failed");
    }

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLen; ++i) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

std::string hashMultiple(const std::vector<std::string>& parts) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += kPartSeparator;
        joined += parts[i];
    }
    return sha256Hex(joined);
}

std::string shortHash(const std::string& data) {
    return sha256Hex(data).substr(0, 16);
}

std::string contentHash(const std::string& cleanedText) {
    return sha256Hex(cleanedText);
}

std::string aiScoreCacheKey(const std::string& contentHash, const std::string& rubricVersion) {
    return std::string(kAiScorePrefix) + hashMultiple({contentHash, rubricVersion});
}

} // namespace aeo_engine::common
