#ifndef CRYPTO_HPP
#define CRYPTO_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <openssl/evp.h>

// AES-256-GCM sealing for spool snapshots
class Crypto
{
public:
    static constexpr size_t KEY_SIZE = 32;     // 256 bits
    static constexpr size_t GCM_IV_SIZE = 12;  // 96 bits (recommended for GCM)
    static constexpr size_t GCM_TAG_SIZE = 16; // 128 bits

    // Returns ciphertext followed by the tag; aad is authenticated but not encrypted
    static std::vector<uint8_t> encrypt(const std::vector<uint8_t> &plaintext,
                                        const std::vector<uint8_t> &key,
                                        const std::vector<uint8_t> &iv,
                                        const std::vector<uint8_t> &aad = {});

    // Throws std::runtime_error if the data or aad were tampered with
    static std::vector<uint8_t> decrypt(const std::vector<uint8_t> &sealed,
                                        const std::vector<uint8_t> &key,
                                        const std::vector<uint8_t> &iv,
                                        const std::vector<uint8_t> &aad = {});

    static std::vector<uint8_t> randomIV();

    // 64 hex characters -> 32 key bytes; throws std::invalid_argument otherwise
    static std::vector<uint8_t> keyFromHex(const std::string &hex);

private:
    static EVP_CIPHER_CTX *getEncryptContext();
    static EVP_CIPHER_CTX *getDecryptContext();
};

#endif
