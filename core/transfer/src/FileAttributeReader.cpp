#include "FileAttributeReader.h"
#include "LoggerMacros.h"
#include "SystemError.h"
#include <filesystem>
#include <sys/stat.h>

namespace FileCourier {

Result<FileAttributes> FileAttributeReader::read(const std::string& filePath) const {
    struct stat st;
    if (::stat(filePath.c_str(), &st) != 0) {
        return fileError(errno, "Cannot stat", filePath);
    }
    if (!S_ISREG(st.st_mode)) {
        return Error{ErrorCode::NotRegularFile, "Not a regular file: " + filePath};
    }

    auto checksum = FileChecksum::compute(filePath, algorithm_);
    if (!checksum) {
        return checksum.error();
    }

    FileAttributes attrs;
    attrs.size = static_cast<uint64_t>(st.st_size);
    attrs.checksum = std::move(*checksum);
    attrs.basename = basenameOf(filePath);

    LOG_DEBUG_COMP_IF("Read attributes of " + filePath + ": size=" + std::to_string(attrs.size) +
                      " " + FileChecksum::algorithmName(algorithm_) + "=" + attrs.checksum,
                      "FileAttributes");
    return attrs;
}

std::string FileAttributeReader::basenameOf(const std::string& filePath) {
    std::filesystem::path path(filePath);
    if (!path.has_filename()) {
        // "dir/" style input: fall back to the last named component
        path = path.parent_path();
    }
    return path.filename().string();
}

} // namespace FileCourier
