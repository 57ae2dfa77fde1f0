#include "FileChecksum.h"
#include "FdGuard.h"
#include "SystemError.h"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <fcntl.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace FileCourier {

namespace {

    using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    const EVP_MD* digestFor(ChecksumAlgorithm algorithm) {
        return algorithm == ChecksumAlgorithm::SHA256 ? EVP_sha256() : EVP_md5();
    }

    std::string toHex(const unsigned char* digest, unsigned int length) {
        std::stringstream ss;
        for (unsigned int i = 0; i < length; ++i) {
            ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[i]);
        }
        return ss.str();
    }

    Result<DigestContext> beginDigest(ChecksumAlgorithm algorithm) {
        DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx) {
            return Error{ErrorCode::ChecksumFailed, "Failed to allocate digest context"};
        }
        if (EVP_DigestInit_ex(ctx.get(), digestFor(algorithm), nullptr) != 1) {
            return Error{ErrorCode::ChecksumFailed,
                         std::string("Failed to initialise ") + FileChecksum::algorithmName(algorithm)};
        }
        return std::move(ctx);
    }

    Result<std::string> finishDigest(EVP_MD_CTX* ctx) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLen = 0;
        if (EVP_DigestFinal_ex(ctx, digest, &digestLen) != 1) {
            return Error{ErrorCode::ChecksumFailed, "Failed to finalise digest"};
        }
        return toHex(digest, digestLen);
    }

} // namespace

Result<std::string> FileChecksum::compute(const std::string& filePath, ChecksumAlgorithm algorithm) {
    FdGuard fd(::open(filePath.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd) {
        return fileError(errno, "Cannot open for checksum", filePath);
    }

    auto ctx = beginDigest(algorithm);
    if (!ctx) {
        return ctx.error();
    }

    std::vector<unsigned char> buffer(READ_BUFFER_SIZE);
    while (true) {
        ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return fileError(errno, "Read failed during checksum of", filePath);
        }
        if (n == 0) break;
        if (EVP_DigestUpdate(ctx->get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            return Error{ErrorCode::ChecksumFailed, "Digest update failed for " + filePath};
        }
    }

    return finishDigest(ctx->get());
}

Result<std::string> FileChecksum::computeBytes(const uint8_t* data, size_t length,
                                               ChecksumAlgorithm algorithm) {
    auto ctx = beginDigest(algorithm);
    if (!ctx) {
        return ctx.error();
    }
    if (length > 0 && EVP_DigestUpdate(ctx->get(), data, length) != 1) {
        return Error{ErrorCode::ChecksumFailed, "Digest update failed"};
    }
    return finishDigest(ctx->get());
}

const char* FileChecksum::algorithmName(ChecksumAlgorithm algorithm) {
    switch (algorithm) {
        case ChecksumAlgorithm::MD5: return "md5";
        case ChecksumAlgorithm::SHA256: return "sha256";
    }
    return "unknown";
}

bool FileChecksum::parseAlgorithm(const std::string& name, ChecksumAlgorithm& algorithm) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "md5") {
        algorithm = ChecksumAlgorithm::MD5;
        return true;
    }
    if (lowered == "sha256" || lowered == "sha-256") {
        algorithm = ChecksumAlgorithm::SHA256;
        return true;
    }
    return false;
}

} // namespace FileCourier
