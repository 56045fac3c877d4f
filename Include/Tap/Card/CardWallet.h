/**
 * @file CardWallet.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Wallet stored on a card
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
#include "Tap/BufferSizes.h"

namespace tap
{
    using PublicKey = etl::vector<uint8_t, buffer::PUBLIC_KEY_MAX>;

    enum class WalletStatus : uint8_t
    {
        Empty = 0x01,
        Loaded = 0x02,
        Purged = 0x03
    };

    struct CardWallet
    {
        uint32_t index;
        PublicKey publicKey;
        etl::string<buffer::TEXT_FIELD_MAX> curve;
        WalletStatus status;
        /// Signatures issued by this wallet, when the firmware reports it
        etl::optional<uint64_t> totalSignedHashes;
        etl::optional<uint64_t> remainingSignatures;

        CardWallet() : index(0), status(WalletStatus::Empty) {}
    };

} // namespace tap
