/**
 * @file TlvTag.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief TLV tag registry implementation
 * @version 0.1
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Tlv/TlvTag.h"

using namespace tap;

namespace
{
    const TlvTagInfo TAG_REGISTRY[] = {
        {TlvTag::CardId,                    "CardId",                    TlvValueType::HexString,  false},
        {TlvTag::Status,                    "Status",                    TlvValueType::Enum,       false},
        {TlvTag::CardPublicKey,             "CardPublicKey",             TlvValueType::ByteArray,  false},
        {TlvTag::CardSignature,             "CardSignature",             TlvValueType::ByteArray,  false},
        {TlvTag::CurveId,                   "CurveId",                   TlvValueType::Utf8String, false},
        {TlvTag::SigningMethod,             "SigningMethod",             TlvValueType::Byte,       false},
        {TlvTag::MaxSignatures,             "MaxSignatures",             TlvValueType::Int,        false},
        {TlvTag::PauseBeforePin2,           "PauseBeforePin2",           TlvValueType::UInt16,     false},
        {TlvTag::SettingsMask,              "SettingsMask",              TlvValueType::Int,        false},
        {TlvTag::CardData,                  "CardData",                  TlvValueType::Nested,     false},
        {TlvTag::Pin,                       "Pin",                       TlvValueType::ByteArray,  false},
        {TlvTag::Pin2,                      "Pin2",                      TlvValueType::ByteArray,  false},
        {TlvTag::Challenge,                 "Challenge",                 TlvValueType::ByteArray,  false},
        {TlvTag::Salt,                      "Salt",                      TlvValueType::ByteArray,  false},
        {TlvTag::ValidationCounter,         "ValidationCounter",         TlvValueType::Int,        false},
        {TlvTag::ManufacturerName,          "ManufacturerName",          TlvValueType::Utf8String, false},
        {TlvTag::InteractionMode,           "InteractionMode",           TlvValueType::Enum,       false},
        {TlvTag::LegacyMode,                "LegacyMode",                TlvValueType::Byte,       false},
        {TlvTag::IssuerDataPublicKey,       "IssuerDataPublicKey",       TlvValueType::ByteArray,  false},
        {TlvTag::IssuerData,                "IssuerData",                TlvValueType::ByteArray,  false},
        {TlvTag::IssuerDataSignature,       "IssuerDataSignature",       TlvValueType::ByteArray,  false},
        {TlvTag::IssuerDataCounter,         "IssuerDataCounter",         TlvValueType::Int,        false},
        {TlvTag::IsActivated,               "IsActivated",               TlvValueType::Bool,       false},
        {TlvTag::TerminalPublicKey,         "TerminalPublicKey",         TlvValueType::ByteArray,  false},
        {TlvTag::WalletPublicKey,           "WalletPublicKey",           TlvValueType::ByteArray,  false},
        {TlvTag::WalletSignature,           "WalletSignature",           TlvValueType::ByteArray,  false},
        {TlvTag::WalletRemainingSignatures, "WalletRemainingSignatures", TlvValueType::Int,        false},
        {TlvTag::WalletSignedHashes,        "WalletSignedHashes",        TlvValueType::Int,        false},
        {TlvTag::CheckWalletCounter,        "CheckWalletCounter",        TlvValueType::Int,        false},
        {TlvTag::WalletIndex,               "WalletIndex",               TlvValueType::Int,        false},
        {TlvTag::WalletsCount,              "WalletsCount",              TlvValueType::Byte,       false},
        {TlvTag::WalletStatus,              "WalletStatus",              TlvValueType::Enum,       false},
        {TlvTag::FirmwareVersion,           "FirmwareVersion",           TlvValueType::Utf8String, false},
        {TlvTag::BatchId,                   "BatchId",                   TlvValueType::HexString,  false},
        {TlvTag::ManufactureDateTime,       "ManufactureDateTime",       TlvValueType::Date,       false},
        {TlvTag::IssuerName,                "IssuerName",                TlvValueType::Utf8String, false},
        {TlvTag::BackupCardPublicKey,       "BackupCardPublicKey",       TlvValueType::ByteArray,  true},
        {TlvTag::TrustedCard,               "TrustedCard",               TlvValueType::Nested,     true},
        {TlvTag::TrustedCardKeyHash,        "TrustedCardKeyHash",        TlvValueType::ByteArray,  false},
        {TlvTag::CardKeyAttestation,        "CardKeyAttestation",        TlvValueType::Enum,       false},
        {TlvTag::WalletKeysAttestation,     "WalletKeysAttestation",     TlvValueType::Enum,       false},
        {TlvTag::AttestationMode,           "AttestationMode",           TlvValueType::Enum,       false},
        {TlvTag::StorageVersion,            "StorageVersion",            TlvValueType::Byte,       false},
    };
}

const TlvTagInfo* tap::describeTag(TlvTag tag)
{
    for (const TlvTagInfo& info : TAG_REGISTRY)
    {
        if (info.tag == tag)
        {
            return &info;
        }
    }

    return nullptr;
}

TlvValueType tap::valueTypeOf(TlvTag tag)
{
    const TlvTagInfo* info = describeTag(tag);
    return info ? info->type : TlvValueType::ByteArray;
}

etl::string_view tap::nameOf(TlvTag tag)
{
    const TlvTagInfo* info = describeTag(tag);
    return info ? info->name : etl::string_view("Unknown");
}
