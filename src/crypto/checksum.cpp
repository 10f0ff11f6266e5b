#include "attachvault/crypto/checksum.h"

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>

namespace attachvault::crypto {

std::string Sha256Hex(const std::string& data) {
    Poco::SHA2Engine256 engine;
    engine.update(data.data(), data.size());
    return Poco::DigestEngine::digestToHex(engine.digest());
}

}  // namespace attachvault::crypto
