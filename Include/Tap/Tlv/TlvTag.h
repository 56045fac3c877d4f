/**
 * @file TlvTag.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief TLV tag registry
 * @version 0.1
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string_view.h>
#include <cstdint>

namespace tap
{
    /**
     * @brief Declared value kind of a tag
     */
    enum class TlvValueType : uint8_t
    {
        Byte,           // Fixed 1 byte unsigned
        Enum,           // Fixed 1 byte enumerated code
        UInt16,         // Fixed 2 byte big-endian
        Int,            // Big-endian, minimal width, 1..8 bytes
        ByteArray,
        HexString,      // Raw bytes presented as upper-case hex text
        Utf8String,
        Bool,           // Fixed 1 byte, 0x00 or 0x01
        Date,           // year(2, BE) month day
        Nested          // Value is itself a TLV sequence
    };

    /**
     * @brief Wire tags
     *
     * Values are stable wire constants. 0xE0..0xEF is reserved for host-side
     * records (trust cache persistence) and never sent to a card.
     */
    enum class TlvTag : uint8_t
    {
        Unknown = 0x00,
        CardId = 0x01,
        Status = 0x02,
        CardPublicKey = 0x03,
        CardSignature = 0x04,
        CurveId = 0x05,
        SigningMethod = 0x07,
        MaxSignatures = 0x08,
        PauseBeforePin2 = 0x09,
        SettingsMask = 0x0A,
        CardData = 0x0C,
        Pin = 0x10,
        Pin2 = 0x11,
        Challenge = 0x16,
        Salt = 0x17,
        ValidationCounter = 0x18,
        ManufacturerName = 0x20,
        InteractionMode = 0x23,
        LegacyMode = 0x29,
        IssuerDataPublicKey = 0x30,
        IssuerData = 0x32,
        IssuerDataSignature = 0x33,
        IssuerDataCounter = 0x35,
        IsActivated = 0x3A,
        TerminalPublicKey = 0x5C,
        WalletPublicKey = 0x60,
        WalletSignature = 0x61,
        WalletRemainingSignatures = 0x62,
        WalletSignedHashes = 0x63,
        CheckWalletCounter = 0x64,
        WalletIndex = 0x65,
        WalletsCount = 0x66,
        WalletStatus = 0x68,
        FirmwareVersion = 0x80,
        BatchId = 0x81,
        ManufactureDateTime = 0x82,
        IssuerName = 0x83,
        BackupCardPublicKey = 0xD4,

        TrustedCard = 0xE0,
        TrustedCardKeyHash = 0xE1,
        CardKeyAttestation = 0xE2,
        WalletKeysAttestation = 0xE3,
        AttestationMode = 0xE4,
        StorageVersion = 0xE5
    };

    /**
     * @brief Registry entry for a known tag
     */
    struct TlvTagInfo
    {
        TlvTag tag;
        etl::string_view name;
        TlvValueType type;
        bool multiple;      // Tag may appear more than once in one message
    };

    /**
     * @brief Look up the registry entry of a tag
     *
     * @param tag Tag to describe
     * @return const TlvTagInfo* Entry or nullptr for tags outside the registry
     */
    const TlvTagInfo* describeTag(TlvTag tag);

    /**
     * @brief Declared kind of a tag, ByteArray for unregistered tags
     */
    TlvValueType valueTypeOf(TlvTag tag);

    /**
     * @brief Registry name of a tag, "Unknown" for unregistered tags
     */
    etl::string_view nameOf(TlvTag tag);

} // namespace tap
