#include "vidingest/upload/assembler.h"

#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>

#include <fcntl.h>
#include <unistd.h>

namespace vidingest::upload {
namespace {

/// Closes the descriptor and removes the temp file unless released.
class TempOutput {
public:
    explicit TempOutput(std::string path) : path_(std::move(path)) {
        fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    }
    ~TempOutput() {
        Close();
        if (!released_) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    const std::string& path() const { return path_; }
    void Close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }
    void Release() { released_ = true; }

private:
    std::string path_;
    int fd_{-1};
    bool released_{false};
};

bool WriteAll(int fd, const char* data, std::size_t size) {
    std::size_t offset = 0;
    while (offset < size) {
        ssize_t written = ::write(fd, data + offset, size - offset);
        if (written < 0) {
            return false;
        }
        offset += static_cast<std::size_t>(written);
    }
    return true;
}

}  // namespace

Assembler::Assembler(storage::LocalStorage& storage) : storage_(storage) {}

core::Result<AssembledArtifact> Assembler::Assemble(const AssemblyRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    if (request.total_chunks < 1 || request.output_path.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid assembly request"};
    }

    // Every chunk must be on disk before any byte is written.
    for (int number = 1; number <= request.total_chunks; ++number) {
        if (!std::filesystem::exists(storage_.ChunkPath(request.session_id, number))) {
            return core::Error{core::ErrorCode::kIntegrityError,
                               "chunk " + std::to_string(number) + " is missing from storage"};
        }
    }

    TempOutput out(storage_.TempPath());
    if (!out.is_open()) {
        return core::Error{core::ErrorCode::kStorageUnavailable, "failed to open assembly output"};
    }

    Poco::SHA2Engine256 sha256;
    std::uint64_t total = 0;
    std::array<char, 65536> buffer{};
    for (int number = 1; number <= request.total_chunks; ++number) {
        std::ifstream in(storage_.ChunkPath(request.session_id, number), std::ios::binary);
        if (!in.is_open()) {
            return core::Error{core::ErrorCode::kIntegrityError,
                               "chunk " + std::to_string(number) + " could not be read"};
        }
        while (in) {
            in.read(buffer.data(), buffer.size());
            const std::streamsize bytes = in.gcount();
            if (bytes <= 0) {
                break;
            }
            if (!WriteAll(out.fd(), buffer.data(), static_cast<std::size_t>(bytes))) {
                return core::Error{core::ErrorCode::kStorageUnavailable,
                                   "failed to write assembly output"};
            }
            sha256.update(buffer.data(), static_cast<unsigned int>(bytes));
            total += static_cast<std::uint64_t>(bytes);
        }
        if (in.bad()) {
            return core::Error{core::ErrorCode::kStorageUnavailable,
                               "failed to read chunk " + std::to_string(number)};
        }
    }

    if (total != request.declared_size) {
        return core::Error{core::ErrorCode::kIntegrityError,
                           "assembled size " + std::to_string(total) +
                               " does not match declared size " +
                               std::to_string(request.declared_size)};
    }
    if (::fsync(out.fd()) != 0) {
        return core::Error{core::ErrorCode::kStorageUnavailable, "failed to sync assembly output"};
    }
    out.Close();

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(request.output_path).parent_path(),
                                        ec);
    std::filesystem::rename(out.path(), request.output_path, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kStorageUnavailable,
                           "failed to publish artifact: " + ec.message()};
    }
    out.Release();

    AssembledArtifact artifact;
    artifact.path = request.output_path;
    artifact.size_bytes = total;
    artifact.sha256 = Poco::DigestEngine::digestToHex(sha256.digest());
    artifact.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - start)
                               .count();
    return artifact;
}

}  // namespace vidingest::upload
