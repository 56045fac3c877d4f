/**
 * @file IOnlineCardVerifier.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Online card verification service interface
 * @version 0.1
 * @date 2026-03-10
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <functional>
#include <etl/expected.h>
#include <etl/string.h>
#include <etl/vector.h>
#include "Tap/BufferSizes.h"
#include "Error/Error.h"

namespace tap
{
    /**
     * @brief Answer of the verification service for one card
     */
    struct VerificationRecord
    {
        etl::string<buffer::CARD_ID_TEXT_MAX> cardId;
        bool passed = false;
        etl::string<buffer::TEXT_FIELD_MAX> manufacturerName;
    };

    using VerificationResult = etl::expected<VerificationRecord, error::Error>;

    /**
     * @brief Verification backend
     *
     * Transport and service failures are reported as
     * AttestationError::NetworkError. A card the service does not know or
     * rejects is reported as AttestationError::CardVerificationFailed, or
     * as a record with passed == false.
     */
    class IOnlineCardVerifier
    {
    public:
        using Callback = std::function<void(const VerificationResult&)>;

        virtual ~IOnlineCardVerifier() = default;

        /**
         * @brief Look up a card
         *
         * The callback is invoked exactly once, from any thread, possibly
         * before this call returns.
         */
        virtual void getCardInfo(
            etl::string_view cardId,
            const etl::ivector<uint8_t>& cardPublicKey,
            Callback callback) = 0;
    };

} // namespace tap
