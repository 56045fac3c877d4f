/**
 * @file Error.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief
 * @version 0.1
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "TlvError.h"
#include "EnvelopeError.h"
#include "TransportError.h"
#include "StatusWordError.h"
#include "CommandError.h"
#include "AttestationError.h"
#include "StorageError.h"

#include <etl/variant.h>
#include <etl/string_view.h>
#include <etl/string.h>
#include <type_traits>

namespace error {

    enum class ErrorLayer : uint8_t {
        Tlv,
        Envelope,
        Transport,
        StatusWord,
        Command,
        Attestation,
        Storage
    };


    class Error {
        public:

            using ErrorVariant = etl::variant<
                TlvError,
                EnvelopeError,
                TransportError,
                StatusWordError,
                CommandError,
                AttestationError,
                StorageError
            >;

            Error(ErrorLayer layer, ErrorVariant errorCode)
                : layer(layer), errorCode(errorCode) {}

            static Error fromTlv(TlvError err) {
                return Error{ErrorLayer::Tlv, err};
            }

            static Error fromEnvelope(EnvelopeError err) {
                return Error{ErrorLayer::Envelope, err};
            }

            static Error fromTransport(TransportError err) {
                return Error{ErrorLayer::Transport, err};
            }

            static Error fromStatusWord(StatusWordError err) {
                return Error{ErrorLayer::StatusWord, err};
            }

            static Error fromCommand(CommandError err) {
                return Error{ErrorLayer::Command, err};
            }

            static Error fromAttestation(AttestationError err) {
                return Error{ErrorLayer::Attestation, err};
            }

            static Error fromStorage(StorageError err) {
                return Error{ErrorLayer::Storage, err};
            }

            template<typename T>
            bool is() const {
                return etl::holds_alternative<T>(errorCode);
            }

            template<typename T>
            T get() const {
                return etl::get<T>(errorCode);
            }

            template<typename T>
            bool is(T value) const {
                return is<T>() && get<T>() == value;
            }

            ErrorLayer getLayer() const {
                return layer;
            }

            /**
             * @brief Cryptographic signature mismatch reported by a card or the online service
             */
            bool isVerificationFailure() const {
                return is(AttestationError::CardVerificationFailed);
            }

            bool isUserCancelled() const {
                return is(AttestationError::UserCancelled);
            }

            /**
             * @brief Errors the command protocol may resolve by updating the environment and re-sending
             */
            bool isRecoverable() const {
                return is(StatusWordError::InvalidAccessCode) ||
                       is(StatusWordError::InvalidPasscode) ||
                       is(StatusWordError::NeedEncryption);
            }

            etl::string_view layerName(ErrorLayer layer) const {
                switch (layer) {
                    case ErrorLayer::Tlv:
                        return "TLV";
                    case ErrorLayer::Envelope:
                        return "Envelope";
                    case ErrorLayer::Transport:
                        return "Transport";
                    case ErrorLayer::StatusWord:
                        return "StatusWord";
                    case ErrorLayer::Command:
                        return "Command";
                    case ErrorLayer::Attestation:
                        return "Attestation";
                    case ErrorLayer::Storage:
                        return "Storage";
                    default:
                        return "Unknown";
                }
            }

            etl::string_view nameOf(TlvError err) const {
                switch (err) {
                    case TlvError::Ok:
                        return "Ok";
                    case TlvError::EncodingFailed:
                        return "EncodingFailed";
                    case TlvError::InvalidValue:
                        return "InvalidValue";
                    case TlvError::ValueTooLong:
                        return "ValueTooLong";
                    case TlvError::DuplicateTag:
                        return "DuplicateTag";
                    case TlvError::UnknownTag:
                        return "UnknownTag";
                    case TlvError::MissingTag:
                        return "MissingTag";
                    case TlvError::TypeMismatch:
                        return "TypeMismatch";
                    case TlvError::MalformedRecord:
                        return "MalformedRecord";
                    case TlvError::BufferOverflow:
                        return "BufferOverflow";
                    default:
                        return "UndefinedTlvError";
                }
            }

            etl::string_view nameOf(EnvelopeError err) const {
                switch (err) {
                    case EnvelopeError::Ok:
                        return "Ok";
                    case EnvelopeError::DecryptionFailed:
                        return "DecryptionFailed";
                    case EnvelopeError::MissingEncryptionKey:
                        return "MissingEncryptionKey";
                    case EnvelopeError::InvalidKeyLength:
                        return "InvalidKeyLength";
                    case EnvelopeError::PayloadTooLarge:
                        return "PayloadTooLarge";
                    default:
                        return "UndefinedEnvelopeError";
                }
            }

            etl::string_view nameOf(TransportError err) const {
                switch (err) {
                    case TransportError::Ok:
                        return "Ok";
                    case TransportError::Timeout:
                        return "Timeout";
                    case TransportError::TagLost:
                        return "TagLost";
                    case TransportError::SessionClosed:
                        return "SessionClosed";
                    case TransportError::FrameError:
                        return "FrameError";
                    case TransportError::Unknown:
                        return "Unknown";
                    default:
                        return "UndefinedTransportError";
                }
            }

            etl::string_view nameOf(StatusWordError err) const {
                switch (err) {
                    case StatusWordError::Ok:
                        return "ProcessCompleted";
                    case StatusWordError::ErrorProcessingCommand:
                        return "ErrorProcessingCommand";
                    case StatusWordError::NeedEncryption:
                        return "NeedEncryption";
                    case StatusWordError::InvalidState:
                        return "InvalidState";
                    case StatusWordError::FileNotFound:
                        return "FileNotFound";
                    case StatusWordError::InvalidParams:
                        return "InvalidParams";
                    case StatusWordError::WalletNotFound:
                        return "WalletNotFound";
                    case StatusWordError::InvalidAccessCode:
                        return "InvalidAccessCode";
                    case StatusWordError::InvalidPasscode:
                        return "InvalidPasscode";
                    case StatusWordError::InsNotSupported:
                        return "InsNotSupported";
                    case StatusWordError::NeedPause:
                        return "NeedPause";
                    case StatusWordError::Unknown:
                        return "UnknownStatus";
                    default:
                        return "UndefinedStatusWord";
                }
            }

            etl::string_view nameOf(CommandError err) const {
                switch (err) {
                    case CommandError::Ok:
                        return "Ok";
                    case CommandError::MissingPreflightRead:
                        return "MissingPreflightRead";
                    case CommandError::NotPersonalized:
                        return "NotPersonalized";
                    case CommandError::NotActivated:
                        return "NotActivated";
                    case CommandError::NotSupportedFirmwareVersion:
                        return "NotSupportedFirmwareVersion";
                    case CommandError::MissingIssuerPublicKey:
                        return "MissingIssuerPublicKey";
                    case CommandError::DataSizeTooLarge:
                        return "DataSizeTooLarge";
                    case CommandError::MissingCounter:
                        return "MissingCounter";
                    case CommandError::IssuerSignatureInvalid:
                        return "IssuerSignatureInvalid";
                    case CommandError::DataCannotBeWritten:
                        return "DataCannotBeWritten";
                    case CommandError::WalletNotFound:
                        return "WalletNotFound";
                    case CommandError::UnsupportedCurve:
                        return "UnsupportedCurve";
                    case CommandError::InvalidResponse:
                        return "InvalidResponse";
                    case CommandError::InvalidState:
                        return "InvalidState";
                    case CommandError::RetryLimitExceeded:
                        return "RetryLimitExceeded";
                    default:
                        return "UndefinedCommandError";
                }
            }

            etl::string_view nameOf(AttestationError err) const {
                switch (err) {
                    case AttestationError::Ok:
                        return "Ok";
                    case AttestationError::CardVerificationFailed:
                        return "CardVerificationFailed";
                    case AttestationError::UserCancelled:
                        return "UserCancelled";
                    case AttestationError::UnsupportedMode:
                        return "UnsupportedMode";
                    case AttestationError::NetworkError:
                        return "NetworkError";
                    case AttestationError::CryptoFailure:
                        return "CryptoFailure";
                    default:
                        return "UndefinedAttestationError";
                }
            }

            etl::string_view nameOf(StorageError err) const {
                switch (err) {
                    case StorageError::Ok:
                        return "Ok";
                    case StorageError::ReadFailed:
                        return "ReadFailed";
                    case StorageError::WriteFailed:
                        return "WriteFailed";
                    case StorageError::CorruptedData:
                        return "CorruptedData";
                    case StorageError::CapacityExceeded:
                        return "CapacityExceeded";
                    default:
                        return "UndefinedStorageError";
                }
            }

            etl::string<160> toString() const {
                etl::string<160> result;
                auto layer_name = layerName(layer);
                result.assign(layer_name.begin(), layer_name.end());
                result.append(" Error: ");

                auto error_name = etl::visit([this](auto&& arg) -> etl::string_view {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, TlvError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, EnvelopeError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, TransportError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, StatusWordError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, CommandError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, AttestationError>) {
                            return nameOf(arg);
                        } else if constexpr (std::is_same_v<T, StorageError>) {
                            return nameOf(arg);
                        } else {
                            return "Unknown Error Type";
                        }
                    }, errorCode);

                result.append(error_name.begin(), error_name.end());
                return result;
            }

        private:
            ErrorLayer   layer;
            ErrorVariant errorCode;

    };

} // namespace error
