/**
 * @file AesCmac.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief AES-128 CBC and CMAC primitives implementation
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Utils/AesCmac.h"
#include <aes.hpp>

namespace
{
    constexpr size_t BLOCK = 16U;

    void leftShiftOneBit(const uint8_t* input, uint8_t* output)
    {
        uint8_t overflow = 0;
        for (size_t i = BLOCK; i > 0U; --i)
        {
            const uint8_t current = input[i - 1U];
            output[i - 1U] = static_cast<uint8_t>((current << 1U) | overflow);
            overflow = static_cast<uint8_t>((current & 0x80U) ? 1U : 0U);
        }
    }

    void xorBlock(const uint8_t* a, const uint8_t* b, uint8_t* output)
    {
        for (size_t i = 0; i < BLOCK; ++i)
        {
            output[i] = static_cast<uint8_t>(a[i] ^ b[i]);
        }
    }
}

namespace crypto
{
    void aesEncryptBlock(const uint8_t* key, const uint8_t* input, uint8_t* output)
    {
        uint8_t block[BLOCK];
        for (size_t i = 0; i < BLOCK; ++i)
        {
            block[i] = input[i];
        }

        AES_ctx aesContext;
        AES_init_ctx(&aesContext, key);
        AES_ECB_encrypt(&aesContext, block);

        for (size_t i = 0; i < BLOCK; ++i)
        {
            output[i] = block[i];
        }
    }

    void generateCmacSubkeys(const uint8_t* key, uint8_t* k1, uint8_t* k2)
    {
        uint8_t l[BLOCK] = {0};
        const uint8_t zeroBlock[BLOCK] = {0};
        aesEncryptBlock(key, zeroBlock, l);

        leftShiftOneBit(l, k1);
        if ((l[0] & 0x80U) != 0U)
        {
            k1[BLOCK - 1U] ^= AES_CMAC_RB;
        }

        leftShiftOneBit(k1, k2);
        if ((k1[0] & 0x80U) != 0U)
        {
            k2[BLOCK - 1U] ^= AES_CMAC_RB;
        }
    }

    void calculateCmac(const uint8_t* key, const uint8_t* message, size_t messageLength, uint8_t* outCmac)
    {
        uint8_t k1[BLOCK];
        uint8_t k2[BLOCK];
        generateCmacSubkeys(key, k1, k2);

        size_t blockCount = (messageLength + BLOCK - 1U) / BLOCK;
        bool lastBlockComplete = (messageLength != 0U) && ((messageLength % BLOCK) == 0U);
        if (blockCount == 0U)
        {
            blockCount = 1U;
            lastBlockComplete = false;
        }

        const size_t lastOffset = (blockCount - 1U) * BLOCK;
        uint8_t mLast[BLOCK];
        if (lastBlockComplete)
        {
            xorBlock(message + lastOffset, k1, mLast);
        }
        else
        {
            const size_t lastLength = messageLength - lastOffset;
            uint8_t padded[BLOCK] = {0};
            for (size_t i = 0; i < lastLength; ++i)
            {
                padded[i] = message[lastOffset + i];
            }
            padded[lastLength] = ISO_PADDING_MARKER;
            xorBlock(padded, k2, mLast);
        }

        uint8_t x[BLOCK] = {0};
        uint8_t y[BLOCK];
        for (size_t blockIndex = 0; blockIndex + 1U < blockCount; ++blockIndex)
        {
            xorBlock(x, message + (blockIndex * BLOCK), y);
            aesEncryptBlock(key, y, x);
        }

        xorBlock(x, mLast, y);
        aesEncryptBlock(key, y, outCmac);
    }

    bool padIso9797M2(etl::ivector<uint8_t>& data)
    {
        const size_t padded = ((data.size() / BLOCK) + 1U) * BLOCK;
        if (padded > data.capacity())
        {
            return false;
        }

        data.push_back(ISO_PADDING_MARKER);
        while (data.size() < padded)
        {
            data.push_back(0x00U);
        }
        return true;
    }

    bool unpadIso9797M2(etl::ivector<uint8_t>& data)
    {
        size_t length = data.size();
        while (length > 0U && data[length - 1U] == 0x00U)
        {
            --length;
        }

        if (length == 0U || data[length - 1U] != ISO_PADDING_MARKER || (data.size() - length) >= BLOCK)
        {
            return false;
        }

        data.resize(length - 1U);
        return true;
    }

    bool aesCbcEncrypt(const uint8_t* key, const uint8_t* iv, etl::ivector<uint8_t>& data)
    {
        if ((data.size() % BLOCK) != 0U)
        {
            return false;
        }

        AES_ctx aesContext;
        AES_init_ctx_iv(&aesContext, key, iv);
        AES_CBC_encrypt_buffer(&aesContext, data.data(), data.size());
        return true;
    }

    bool aesCbcDecrypt(const uint8_t* key, const uint8_t* iv, etl::ivector<uint8_t>& data)
    {
        if ((data.size() % BLOCK) != 0U)
        {
            return false;
        }

        AES_ctx aesContext;
        AES_init_ctx_iv(&aesContext, key, iv);
        AES_CBC_decrypt_buffer(&aesContext, data.data(), data.size());
        return true;
    }

} // namespace crypto
