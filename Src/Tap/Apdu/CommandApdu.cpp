/**
 * @file CommandApdu.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Command APDU implementation
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Tap/Apdu/CommandApdu.h"

using namespace tap;

namespace
{
    etl::unexpected<error::Error> frameError()
    {
        return etl::unexpected<error::Error>(error::Error::fromTransport(error::TransportError::FrameError));
    }
}

etl::expected<void, error::Error> CommandApdu::serialize(etl::ivector<uint8_t>& out) const
{
    out.clear();
    if (out.capacity() < buffer::APDU_HEADER_SIZE + buffer::APDU_EXTENDED_LC_SIZE + data.size())
    {
        return frameError();
    }

    out.push_back(cla);
    out.push_back(static_cast<uint8_t>(ins));
    out.push_back(p1);
    out.push_back(p2);

    // Extended Lc
    out.push_back(0x00);
    out.push_back(static_cast<uint8_t>((data.size() >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(data.size() & 0xFF));

    out.insert(out.end(), data.begin(), data.end());
    return {};
}

etl::expected<CommandApdu, error::Error> CommandApdu::parse(const etl::ivector<uint8_t>& frame)
{
    const size_t headerSize = buffer::APDU_HEADER_SIZE + buffer::APDU_EXTENDED_LC_SIZE;
    if (frame.size() < headerSize || frame[4] != 0x00)
    {
        return frameError();
    }

    const size_t length = (static_cast<size_t>(frame[5]) << 8) | frame[6];
    if (frame.size() != headerSize + length || length > buffer::APDU_DATA_MAX)
    {
        return frameError();
    }

    CommandApdu apdu;
    apdu.cla = frame[0];
    apdu.ins = static_cast<Instruction>(frame[1]);
    apdu.p1 = frame[2];
    apdu.p2 = frame[3];
    apdu.data.assign(frame.begin() + headerSize, frame.end());
    return apdu;
}
