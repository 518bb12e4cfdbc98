#include "vidingest/chunks/chunk_store.h"

#include <algorithm>
#include <cmath>

namespace vidingest::chunks {

double Progress::percent() const {
    if (total_chunks <= 0) {
        return 0.0;
    }
    return std::round(static_cast<double>(uploaded_count) * 10000.0 / total_chunks) / 100.0;
}

Progress BuildProgress(int total_chunks, const std::vector<int>& present) {
    Progress progress;
    progress.total_chunks = total_chunks;
    if (total_chunks <= 0) {
        return progress;
    }
    std::vector<bool> seen(static_cast<size_t>(total_chunks) + 1, false);
    for (int number : present) {
        // Numbers outside the declared range are not progress toward this session.
        if (number >= 1 && number <= total_chunks) {
            seen[static_cast<size_t>(number)] = true;
        }
    }
    for (int number = 1; number <= total_chunks; ++number) {
        if (seen[static_cast<size_t>(number)]) {
            progress.uploaded.push_back(number);
        } else {
            progress.missing.push_back(number);
        }
    }
    progress.uploaded_count = static_cast<int>(progress.uploaded.size());
    return progress;
}

}  // namespace vidingest::chunks
