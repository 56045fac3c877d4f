/**
 * @file Card.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card record implementation
 * @version 0.1
 * @date 2026-03-06
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Card/Card.h"
#include "Utils/ByteUtils.h"

using namespace tap;

const CardWallet* Card::findWallet(uint32_t index) const
{
    for (const CardWallet& wallet : wallets)
    {
        if (wallet.index == index)
        {
            return &wallet;
        }
    }
    return nullptr;
}

etl::expected<void, error::Error> Card::upsertWallet(const CardWallet& wallet)
{
    for (CardWallet& existing : wallets)
    {
        if (existing.index == wallet.index)
        {
            existing = wallet;
            return {};
        }
    }

    if (wallets.full())
    {
        return etl::unexpected(error::Error::fromStorage(error::StorageError::CapacityExceeded));
    }

    wallets.push_back(wallet);
    return {};
}

bool Card::cardIdBytes(etl::ivector<uint8_t>& out) const
{
    return utils::fromHex(etl::string_view(cardId.data(), cardId.size()), out);
}
