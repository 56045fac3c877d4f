/**
 * @file SessionEnvironment.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Session environment implementation
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Session/SessionEnvironment.h"
#include "Utils/CryptoUtils.h"

using namespace tap;

SessionEnvironment::SessionEnvironment(const SdkConfig& config)
    : config(config)
    , card()
    , encryptionMode(config.defaultEncryptionMode)
    , encryptionKey()
    , accessCode(hashCode(DEFAULT_ACCESS_CODE))
    , passcode(hashCode(DEFAULT_PASSCODE))
    , terminalKeyPair()
{
}

const TerminalKeys* SessionEnvironment::terminalKeys() const
{
    const bool linked = !config.linkedTerminal.has_value() || config.linkedTerminal.value();
    if (!linked || !terminalKeyPair.has_value())
    {
        return nullptr;
    }
    return &terminalKeyPair.value();
}

CodeHash SessionEnvironment::hashCode(etl::string_view code)
{
    const crypto::Sha256Digest digest = crypto::sha256(reinterpret_cast<const uint8_t*>(code.data()), code.size());
    return CodeHash(digest.begin(), digest.end());
}
