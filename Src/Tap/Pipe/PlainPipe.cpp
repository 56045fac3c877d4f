/**
 * @file PlainPipe.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Plain pipe implementation
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Pipe/PlainPipe.h"
#include "Error/EnvelopeError.h"

using namespace tap;

namespace
{
    etl::expected<SecurePayload, error::Error> passThrough(const etl::ivector<uint8_t>& payload)
    {
        if (payload.size() > buffer::APDU_DATA_MAX)
        {
            return etl::unexpected(error::Error::fromEnvelope(error::EnvelopeError::PayloadTooLarge));
        }

        SecurePayload result;
        result.assign(payload.begin(), payload.end());
        return result;
    }
}

etl::expected<SecurePayload, error::Error> PlainPipe::protect(const etl::ivector<uint8_t>& payload)
{
    return passThrough(payload);
}

etl::expected<SecurePayload, error::Error> PlainPipe::unprotect(const etl::ivector<uint8_t>& payload)
{
    return passThrough(payload);
}
