/**
 * @file SecureChannel.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Pipe selection implementation
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Pipe/SecureChannel.h"
#include "Utils/Logging.h"

using namespace tap;

etl::expected<ISecurePipe*, error::Error> SecureChannel::makeSecurePipe(
    EncryptionMode mode,
    const etl::ivector<uint8_t>& key)
{
    if (mode == EncryptionMode::None)
    {
        return static_cast<ISecurePipe*>(&plainPipe);
    }

    if (key.empty())
    {
        etl::string_view name = encryptionModeName(mode);
        LOG_ERROR("Encryption mode %.*s requested without a session key", static_cast<int>(name.size()), name.data());
        encPipe.clear();
        return etl::unexpected(error::Error::fromEnvelope(error::EnvelopeError::MissingEncryptionKey));
    }

    auto keyResult = encPipe.setSessionKey(key);
    if (!keyResult)
    {
        return etl::unexpected(keyResult.error());
    }

    return static_cast<ISecurePipe*>(&encPipe);
}
