#include "vidingest/storage/local_storage.h"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <Poco/DigestEngine.h>
#include <Poco/MD5Engine.h>
#include <Poco/UUIDGenerator.h>

#include <fcntl.h>
#include <unistd.h>

namespace vidingest::storage {

LocalStorage::LocalStorage(std::string base_path, std::string temp_path)
    : base_path_(std::move(base_path)), temp_path_(std::move(temp_path)) {
    std::filesystem::create_directories(std::filesystem::path(base_path_) / "chunks");
    std::filesystem::create_directories(std::filesystem::path(base_path_) / "raw");
    std::filesystem::create_directories(temp_path_);
}

core::Result<StoredChunk> LocalStorage::WriteChunk(const std::string& session_id,
                                                   int chunk_number, const std::string& data) {
    if (!IsSafeName(session_id) || chunk_number < 1) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid chunk path"};
    }

    const auto final_path = ChunkPath(session_id, chunk_number);
    // Write to a temp file first, then atomically rename into place.
    const auto temp_path = TempPath();

    const int fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return core::Error{core::ErrorCode::kStorageUnavailable, "failed to open temp file"};
    }
    std::size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            ::close(fd);
            std::remove(temp_path.c_str());
            return core::Error{core::ErrorCode::kStorageUnavailable, "failed to write temp file"};
        }
        offset += static_cast<std::size_t>(written);
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        std::remove(temp_path.c_str());
        return core::Error{core::ErrorCode::kStorageUnavailable, "failed to sync temp file"};
    }
    ::close(fd);

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(final_path).parent_path(), ec);
    std::filesystem::rename(temp_path, final_path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return core::Error{core::ErrorCode::kStorageUnavailable, "failed to publish chunk"};
    }

    Poco::MD5Engine md5;
    md5.update(data.data(), static_cast<unsigned int>(data.size()));

    StoredChunk stored;
    stored.path = final_path;
    stored.size_bytes = data.size();
    stored.content_hash = Poco::DigestEngine::digestToHex(md5.digest());
    return stored;
}

core::Result<void> LocalStorage::DeleteChunks(const std::string& session_id) {
    if (!IsSafeName(session_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid session id"};
    }
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::path(base_path_) / "chunks" / session_id, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kStorageUnavailable, ec.message()};
    }
    return core::Ok();
}

std::string LocalStorage::ChunkPath(const std::string& session_id, int chunk_number) const {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%06d", chunk_number);
    return (std::filesystem::path(base_path_) / "chunks" / session_id / name).string();
}

std::string LocalStorage::ArtifactPath(const std::string& video_id,
                                       const std::string& extension) const {
    return (std::filesystem::path(base_path_) / "raw" / (video_id + "." + extension)).string();
}

std::string LocalStorage::TempPath() const {
    const auto temp_name = Poco::UUIDGenerator().createOne().toString();
    return (std::filesystem::path(temp_path_) / temp_name).string();
}

bool LocalStorage::IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) {
            return false;
        }
    }
    if (name == "." || name == "..") {
        return false;
    }
    return true;
}

std::string LocalStorage::ExtensionOf(const std::string& filename) {
    const auto dot = filename.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= filename.size()) {
        return "";
    }
    std::string ext = filename.substr(dot + 1);
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

}  // namespace vidingest::storage
