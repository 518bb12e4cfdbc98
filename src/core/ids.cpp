#include "vidingest/core/ids.h"

#include <Poco/UUIDGenerator.h>

namespace vidingest::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator().createOne().toString();
}

std::string GenerateId() {
    // Random (v4) UUIDs so ids are not guessable from creation order.
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

}  // namespace vidingest::core
