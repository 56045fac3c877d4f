/**
 * @file PlainPipe.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Plain (no security) pipe
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "ISecurePipe.h"

namespace tap
{
    /**
     * @brief Plain pipe (no security)
     *
     * Passes payloads through unchanged
     */
    class PlainPipe : public ISecurePipe
    {
    public:
        etl::expected<SecurePayload, error::Error> protect(const etl::ivector<uint8_t>& payload) override;

        etl::expected<SecurePayload, error::Error> unprotect(const etl::ivector<uint8_t>& payload) override;
    };

} // namespace tap
