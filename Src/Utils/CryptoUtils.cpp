/**
 * @file CryptoUtils.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Hashing, signature verification and randomness implementation
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Utils/CryptoUtils.h"
#include "Utils/Logging.h"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace
{
    constexpr size_t SCALAR_SIZE = 32;
    constexpr size_t ED25519_KEY_SIZE = 32;
    constexpr size_t ED25519_SIGNATURE_SIZE = 64;

    etl::unexpected<error::Error> cryptoFailure()
    {
        return etl::unexpected<error::Error>(
            error::Error::fromAttestation(error::AttestationError::CryptoFailure));
    }

    etl::expected<bool, error::Error> verifyEcdsa(
        int curveNid,
        const etl::ivector<uint8_t>& publicKey,
        const etl::ivector<uint8_t>& message,
        const etl::ivector<uint8_t>& signature)
    {
        if (signature.size() != SCALAR_SIZE * 2U)
        {
            LOG_WARN("Signature has %u bytes, expected %u", static_cast<unsigned>(signature.size()),
                     static_cast<unsigned>(SCALAR_SIZE * 2U));
            return cryptoFailure();
        }

        EC_KEY* key = EC_KEY_new_by_curve_name(curveNid);
        if (!key)
        {
            LOG_ERROR("Failed to create EC key for curve %d", curveNid);
            return cryptoFailure();
        }

        const EC_GROUP* group = EC_KEY_get0_group(key);
        EC_POINT* point = EC_POINT_new(group);
        if (!point ||
            EC_POINT_oct2point(group, point, publicKey.data(), publicKey.size(), nullptr) != 1 ||
            EC_KEY_set_public_key(key, point) != 1)
        {
            LOG_WARN("Failed to parse public key (%u bytes)", static_cast<unsigned>(publicKey.size()));
            EC_POINT_free(point);
            EC_KEY_free(key);
            return cryptoFailure();
        }
        EC_POINT_free(point);

        ECDSA_SIG* sig = ECDSA_SIG_new();
        BIGNUM* r = BN_bin2bn(signature.data(), SCALAR_SIZE, nullptr);
        BIGNUM* s = BN_bin2bn(signature.data() + SCALAR_SIZE, SCALAR_SIZE, nullptr);
        if (!sig || !r || !s || ECDSA_SIG_set0(sig, r, s) != 1)
        {
            BN_free(r);
            BN_free(s);
            ECDSA_SIG_free(sig);
            EC_KEY_free(key);
            return cryptoFailure();
        }

        const crypto::Sha256Digest digest = crypto::sha256(message);
        const int verdict = ECDSA_do_verify(digest.data(), static_cast<int>(digest.size()), sig, key);

        ECDSA_SIG_free(sig);
        EC_KEY_free(key);

        if (verdict < 0)
        {
            LOG_ERROR("ECDSA verification error");
            return cryptoFailure();
        }

        return verdict == 1;
    }
}

namespace crypto
{
    Sha256Digest sha256(const uint8_t* data, size_t length)
    {
        Sha256Digest digest;
        digest.resize(tap::buffer::SHA256_SIZE);
        SHA256(data, length, digest.data());
        return digest;
    }

    Sha256Digest sha256(const etl::ivector<uint8_t>& data)
    {
        return sha256(data.data(), data.size());
    }

    etl::expected<bool, error::Error> verifySecp256k1(
        const etl::ivector<uint8_t>& publicKey,
        const etl::ivector<uint8_t>& message,
        const etl::ivector<uint8_t>& signature)
    {
        return verifyEcdsa(NID_secp256k1, publicKey, message, signature);
    }

    etl::expected<bool, error::Error> verifySecp256r1(
        const etl::ivector<uint8_t>& publicKey,
        const etl::ivector<uint8_t>& message,
        const etl::ivector<uint8_t>& signature)
    {
        return verifyEcdsa(NID_X9_62_prime256v1, publicKey, message, signature);
    }

    etl::expected<bool, error::Error> verifyEd25519(
        const etl::ivector<uint8_t>& publicKey,
        const etl::ivector<uint8_t>& message,
        const etl::ivector<uint8_t>& signature)
    {
        if (publicKey.size() != ED25519_KEY_SIZE || signature.size() != ED25519_SIGNATURE_SIZE)
        {
            LOG_WARN("Ed25519 key or signature has the wrong size (%u / %u bytes)",
                     static_cast<unsigned>(publicKey.size()), static_cast<unsigned>(signature.size()));
            return cryptoFailure();
        }

        EVP_PKEY* key = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, publicKey.data(), publicKey.size());
        if (!key)
        {
            LOG_WARN("Failed to parse Ed25519 public key");
            return cryptoFailure();
        }

        EVP_MD_CTX* context = EVP_MD_CTX_new();
        if (!context || EVP_DigestVerifyInit(context, nullptr, nullptr, nullptr, key) != 1)
        {
            EVP_MD_CTX_free(context);
            EVP_PKEY_free(key);
            return cryptoFailure();
        }

        const int verdict = EVP_DigestVerify(context, signature.data(), signature.size(), message.data(), message.size());

        EVP_MD_CTX_free(context);
        EVP_PKEY_free(key);

        if (verdict < 0)
        {
            LOG_ERROR("Ed25519 verification error");
            return cryptoFailure();
        }

        return verdict == 1;
    }

    bool isSupportedCurve(etl::string_view curve)
    {
        return curve.empty() ||
               curve == etl::string_view(CURVE_SECP256K1) ||
               curve == etl::string_view(CURVE_SECP256R1) ||
               curve == etl::string_view(CURVE_ED25519) ||
               curve == etl::string_view(CURVE_ED25519_SLIP0010);
    }

    etl::expected<bool, error::Error> verifySignature(
        etl::string_view curve,
        const etl::ivector<uint8_t>& publicKey,
        const etl::ivector<uint8_t>& message,
        const etl::ivector<uint8_t>& signature)
    {
        if (curve.empty() || curve == etl::string_view(CURVE_SECP256K1))
        {
            return verifySecp256k1(publicKey, message, signature);
        }

        if (curve == etl::string_view(CURVE_SECP256R1))
        {
            return verifySecp256r1(publicKey, message, signature);
        }

        if (curve == etl::string_view(CURVE_ED25519) || curve == etl::string_view(CURVE_ED25519_SLIP0010))
        {
            return verifyEd25519(publicKey, message, signature);
        }

        LOG_ERROR("No signature scheme for curve %.*s", static_cast<int>(curve.size()), curve.data());
        return cryptoFailure();
    }

    etl::expected<void, error::Error> generateRandomBytes(etl::ivector<uint8_t>& output, size_t length)
    {
        output.clear();
        if (length > output.capacity())
        {
            return cryptoFailure();
        }

        output.resize(length);
        if (length > 0U && RAND_bytes(output.data(), static_cast<int>(length)) != 1)
        {
            LOG_ERROR("RAND_bytes failed");
            output.clear();
            return cryptoFailure();
        }

        return {};
    }

} // namespace crypto
