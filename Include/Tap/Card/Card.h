/**
 * @file Card.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card record built by the preflight read
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/optional.h>
#include <etl/string.h>
#include <etl/vector.h>
#include <etl/expected.h>
#include "CardWallet.h"
#include "FirmwareVersion.h"
#include "Tap/Attestation/Attestation.h"
#include "Tap/Tlv/Tlv.h"
#include "Error/Error.h"

namespace tap
{
    enum class CardStatus : uint8_t
    {
        NotPersonalized = 0x00,
        Empty = 0x01,
        Loaded = 0x02,
        Purged = 0x03
    };

    /**
     * @brief SettingsMask bits
     */
    namespace settings
    {
        constexpr uint32_t IS_REUSABLE = 0x0001;
        constexpr uint32_t USE_ACTIVATION = 0x0002;
        constexpr uint32_t PROHIBIT_PURGE_WALLET = 0x0004;
        constexpr uint32_t USE_BLOCK = 0x0008;
        constexpr uint32_t ALLOW_SET_PIN1 = 0x0010;
        constexpr uint32_t ALLOW_SET_PIN2 = 0x0020;
        constexpr uint32_t PROHIBIT_DEFAULT_PIN1 = 0x0100;
        constexpr uint32_t PROTECT_ISSUER_DATA_AGAINST_REPLAY = 0x4000;
        constexpr uint32_t RESTRICT_OVERWRITE_ISSUER_EXTRA_DATA = 0x00100000;
    }

    struct Card
    {
        etl::string<buffer::CARD_ID_TEXT_MAX> cardId;
        etl::string<buffer::TEXT_FIELD_MAX> manufacturerName;
        CardStatus status;
        FirmwareVersion firmwareVersion;
        PublicKey cardPublicKey;
        uint32_t settingsMask;
        etl::optional<PublicKey> issuerPublicKey;
        bool isActivated;
        etl::string<buffer::CARD_ID_TEXT_MAX> batchId;
        etl::optional<TlvDate> manufactureDate;
        etl::string<buffer::TEXT_FIELD_MAX> issuerName;
        etl::vector<CardWallet, buffer::WALLETS_MAX> wallets;
        Attestation attestation;

        Card() : status(CardStatus::NotPersonalized), settingsMask(0), isActivated(false) {}

        bool hasSetting(uint32_t flag) const
        {
            return (settingsMask & flag) != 0U;
        }

        /**
         * @brief Development cards run SDK firmware and never pass online attestation
         */
        bool isDevelopmentCard() const
        {
            return firmwareVersion.type == FirmwareType::Sdk;
        }

        const CardWallet* findWallet(uint32_t index) const;

        /**
         * @brief Replace the wallet with the same index, or append it
         *
         * @return etl::expected<void, error::Error> CapacityExceeded when the list is full
         */
        etl::expected<void, error::Error> upsertWallet(const CardWallet& wallet);

        /**
         * @brief Binary form of the card ID
         *
         * @return false when the card ID is not valid hex
         */
        bool cardIdBytes(etl::ivector<uint8_t>& out) const;
    };

} // namespace tap
