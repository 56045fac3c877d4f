/**
 * @file ResponseApdu.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Response APDU implementation
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Apdu/ResponseApdu.h"

using namespace tap;

error::Error ResponseApdu::statusError() const
{
    using error::StatusWordError;

    const StatusWordError status = static_cast<StatusWordError>(getStatusWord());
    switch (status)
    {
        case StatusWordError::Ok:
        case StatusWordError::ErrorProcessingCommand:
        case StatusWordError::NeedEncryption:
        case StatusWordError::InvalidState:
        case StatusWordError::FileNotFound:
        case StatusWordError::InvalidParams:
        case StatusWordError::WalletNotFound:
        case StatusWordError::InvalidAccessCode:
        case StatusWordError::InvalidPasscode:
        case StatusWordError::InsNotSupported:
        case StatusWordError::NeedPause:
            return error::Error::fromStatusWord(status);
        default:
            return error::Error::fromStatusWord(StatusWordError::Unknown);
    }
}

etl::expected<void, error::Error> ResponseApdu::serialize(etl::ivector<uint8_t>& out) const
{
    out.clear();
    if (out.capacity() < data.size() + buffer::APDU_STATUS_SIZE)
    {
        return etl::unexpected(error::Error::fromTransport(error::TransportError::FrameError));
    }

    out.assign(data.begin(), data.end());
    out.push_back(sw1);
    out.push_back(sw2);
    return {};
}

etl::expected<ResponseApdu, error::Error> ResponseApdu::parse(const etl::ivector<uint8_t>& frame)
{
    if (frame.size() < buffer::APDU_STATUS_SIZE ||
        frame.size() - buffer::APDU_STATUS_SIZE > buffer::APDU_DATA_MAX)
    {
        return etl::unexpected(error::Error::fromTransport(error::TransportError::FrameError));
    }

    ResponseApdu response;
    response.data.assign(frame.begin(), frame.end() - buffer::APDU_STATUS_SIZE);
    response.sw1 = frame[frame.size() - 2];
    response.sw2 = frame[frame.size() - 1];
    return response;
}
