/**
 * @file EncPipe.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Authenticated encryption pipe implementation
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Pipe/EncPipe.h"
#include "Utils/AesCmac.h"
#include "Utils/ByteUtils.h"
#include "Utils/CryptoUtils.h"
#include "Utils/Logging.h"

using namespace tap;

namespace
{
    constexpr size_t BLOCK = buffer::AES_BLOCK_SIZE;
    constexpr uint8_t ENC_KEY_LABEL[] = {0x01U, 'E', 'N', 'C'};
    constexpr uint8_t MAC_KEY_LABEL[] = {0x02U, 'M', 'A', 'C'};

    etl::unexpected<error::Error> envelopeError(error::EnvelopeError err)
    {
        return etl::unexpected<error::Error>(error::Error::fromEnvelope(err));
    }
}

EncPipe::EncPipe()
    : encKey()
    , macKey()
    , keyed(false)
{
    clear();
}

void EncPipe::clear()
{
    encKey.fill(0x00U);
    macKey.fill(0x00U);
    keyed = false;
}

etl::expected<void, error::Error> EncPipe::setSessionKey(const etl::ivector<uint8_t>& sessionKey)
{
    if (sessionKey.size() != buffer::KEY_SIZE_AES128 && sessionKey.size() != buffer::SESSION_KEY_MAX)
    {
        LOG_ERROR("Session key has invalid length %u", static_cast<unsigned>(sessionKey.size()));
        return envelopeError(error::EnvelopeError::InvalidKeyLength);
    }

    // 32-byte keys fold their upper half into the AES-128 master key
    uint8_t master[buffer::KEY_SIZE_AES128];
    for (size_t i = 0; i < buffer::KEY_SIZE_AES128; ++i)
    {
        master[i] = sessionKey[i];
        if (sessionKey.size() == buffer::SESSION_KEY_MAX)
        {
            master[i] = static_cast<uint8_t>(master[i] ^ sessionKey[buffer::KEY_SIZE_AES128 + i]);
        }
    }

    crypto::calculateCmac(master, ENC_KEY_LABEL, sizeof(ENC_KEY_LABEL), encKey.data());
    crypto::calculateCmac(master, MAC_KEY_LABEL, sizeof(MAC_KEY_LABEL), macKey.data());
    keyed = true;
    return {};
}

etl::expected<SecurePayload, error::Error> EncPipe::protect(const etl::ivector<uint8_t>& payload)
{
    if (!keyed)
    {
        return envelopeError(error::EnvelopeError::MissingEncryptionKey);
    }

    const size_t paddedSize = ((payload.size() / BLOCK) + 1U) * BLOCK;
    if (BLOCK + paddedSize + buffer::ENVELOPE_MAC_SIZE > buffer::APDU_DATA_MAX)
    {
        return envelopeError(error::EnvelopeError::PayloadTooLarge);
    }

    etl::vector<uint8_t, BLOCK> iv;
    auto random = crypto::generateRandomBytes(iv, BLOCK);
    if (!random)
    {
        return etl::unexpected(random.error());
    }

    SecurePayload body;
    body.assign(payload.begin(), payload.end());
    if (!crypto::padIso9797M2(body) || !crypto::aesCbcEncrypt(encKey.data(), iv.data(), body))
    {
        return envelopeError(error::EnvelopeError::PayloadTooLarge);
    }

    SecurePayload wrapped;
    wrapped.assign(iv.begin(), iv.end());
    wrapped.insert(wrapped.end(), body.begin(), body.end());

    uint8_t mac[buffer::ENVELOPE_MAC_SIZE];
    crypto::calculateCmac(macKey.data(), wrapped.data(), wrapped.size(), mac);
    wrapped.insert(wrapped.end(), mac, mac + buffer::ENVELOPE_MAC_SIZE);

    return wrapped;
}

etl::expected<SecurePayload, error::Error> EncPipe::unprotect(const etl::ivector<uint8_t>& payload)
{
    if (!keyed)
    {
        return envelopeError(error::EnvelopeError::MissingEncryptionKey);
    }

    if (payload.size() < buffer::ENVELOPE_OVERHEAD ||
        ((payload.size() - BLOCK - buffer::ENVELOPE_MAC_SIZE) % BLOCK) != 0U)
    {
        LOG_WARN("Encrypted payload has invalid length %u", static_cast<unsigned>(payload.size()));
        return envelopeError(error::EnvelopeError::DecryptionFailed);
    }

    const size_t macOffset = payload.size() - buffer::ENVELOPE_MAC_SIZE;
    uint8_t expectedMac[buffer::ENVELOPE_MAC_SIZE];
    crypto::calculateCmac(macKey.data(), payload.data(), macOffset, expectedMac);
    if (!utils::equalConstantTime(expectedMac, payload.data() + macOffset, buffer::ENVELOPE_MAC_SIZE))
    {
        LOG_WARN("Envelope MAC mismatch");
        return envelopeError(error::EnvelopeError::DecryptionFailed);
    }

    SecurePayload plain;
    plain.assign(payload.begin() + BLOCK, payload.begin() + macOffset);
    if (!crypto::aesCbcDecrypt(encKey.data(), payload.data(), plain) || !crypto::unpadIso9797M2(plain))
    {
        return envelopeError(error::EnvelopeError::DecryptionFailed);
    }

    return plain;
}
