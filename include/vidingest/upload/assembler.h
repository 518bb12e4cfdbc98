#pragma once

#include <cstdint>
#include <string>

#include "vidingest/core/result.h"
#include "vidingest/storage/local_storage.h"

namespace vidingest::upload {

/// @brief What the assembler needs to know about a session.
struct AssemblyRequest {
    std::string session_id;
    int total_chunks{0};
    std::uint64_t declared_size{0};
    std::string output_path;
};

/// @brief A published artifact.
struct AssembledArtifact {
    std::string path;
    std::uint64_t size_bytes{0};
    std::string sha256;
    long long duration_ms{0};
};

/// @brief Concatenates chunk files 1..N into the final artifact.
///
/// The output is written under a temporary name, verified against the declared
/// size, fsynced and renamed into place. Any failure leaves no partial output.
class Assembler {
public:
    explicit Assembler(storage::LocalStorage& storage);

    core::Result<AssembledArtifact> Assemble(const AssemblyRequest& request);

private:
    storage::LocalStorage& storage_;
};

}  // namespace vidingest::upload
