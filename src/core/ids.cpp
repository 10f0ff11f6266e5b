#include "attachvault/core/ids.h"

#include <Poco/UUIDGenerator.h>

namespace attachvault::core {

std::string GenerateRequestId() {
    return Poco::UUIDGenerator().createOne().toString();
}

std::string GenerateRandomId() {
    return Poco::UUIDGenerator::defaultGenerator().createRandom().toString();
}

}  // namespace attachvault::core
