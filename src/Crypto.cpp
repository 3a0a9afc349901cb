#include "Crypto.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <memory>
#include <stdexcept>

namespace
{
    struct CipherContextDeleter
    {
        void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };

    using CipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

    std::string opensslError(const std::string &what)
    {
        unsigned long code = ERR_get_error();
        if (code == 0)
        {
            return what;
        }
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        ERR_clear_error();
        return what + ": " + buffer;
    }

    void checkKeyAndIV(const std::vector<uint8_t> &key, const std::vector<uint8_t> &iv)
    {
        if (key.size() != Crypto::KEY_SIZE)
        {
            throw std::runtime_error("Invalid key size. Expected 32 bytes for AES-256");
        }
        if (iv.size() != Crypto::GCM_IV_SIZE)
        {
            throw std::runtime_error("Invalid IV size. Expected 12 bytes for GCM");
        }
    }

    int hexValue(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }
}

// One context per thread, pre-initialized with the cipher
EVP_CIPHER_CTX *Crypto::getEncryptContext()
{
    static thread_local CipherContextPtr encryptCtx;

    if (!encryptCtx)
    {
        CipherContextPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx)
        {
            throw std::runtime_error("Failed to create thread-local encryption context");
        }
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error(opensslError("Failed to pre-initialize encryption context"));
        }
        encryptCtx = std::move(ctx);
    }
    return encryptCtx.get();
}

EVP_CIPHER_CTX *Crypto::getDecryptContext()
{
    static thread_local CipherContextPtr decryptCtx;

    if (!decryptCtx)
    {
        CipherContextPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx)
        {
            throw std::runtime_error("Failed to create thread-local decryption context");
        }
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error(opensslError("Failed to pre-initialize decryption context"));
        }
        decryptCtx = std::move(ctx);
    }
    return decryptCtx.get();
}

std::vector<uint8_t> Crypto::encrypt(const std::vector<uint8_t> &plaintext,
                                     const std::vector<uint8_t> &key,
                                     const std::vector<uint8_t> &iv,
                                     const std::vector<uint8_t> &aad)
{
    checkKeyAndIV(key, iv);

    EVP_CIPHER_CTX *ctx = getEncryptContext();
    if (EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data()) != 1)
    {
        throw std::runtime_error(opensslError("Failed to initialize encryption"));
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1)
    {
        throw std::runtime_error(opensslError("Failed to authenticate associated data"));
    }

    // GCM has no padding: ciphertext is as long as the plaintext
    std::vector<uint8_t> sealed(plaintext.size() + GCM_TAG_SIZE);
    int encryptedLen = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx, sealed.data(), &encryptedLen,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1)
    {
        throw std::runtime_error(opensslError("Failed during encryption update"));
    }

    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx, sealed.data() + encryptedLen, &finalLen) != 1)
    {
        throw std::runtime_error(opensslError("Failed to finalize encryption"));
    }
    if (static_cast<size_t>(encryptedLen + finalLen) != plaintext.size())
    {
        throw std::runtime_error("Unexpected encryption output size");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, GCM_TAG_SIZE,
                            sealed.data() + plaintext.size()) != 1)
    {
        throw std::runtime_error(opensslError("Failed to get authentication tag"));
    }
    return sealed;
}

std::vector<uint8_t> Crypto::decrypt(const std::vector<uint8_t> &sealed,
                                     const std::vector<uint8_t> &key,
                                     const std::vector<uint8_t> &iv,
                                     const std::vector<uint8_t> &aad)
{
    checkKeyAndIV(key, iv);

    if (sealed.size() < GCM_TAG_SIZE)
    {
        throw std::runtime_error("Encrypted data too small - missing authentication tag");
    }
    const size_t ciphertextSize = sealed.size() - GCM_TAG_SIZE;

    EVP_CIPHER_CTX *ctx = getDecryptContext();
    if (EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), iv.data()) != 1)
    {
        throw std::runtime_error(opensslError("Failed to initialize decryption"));
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx, nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1)
    {
        throw std::runtime_error(opensslError("Failed to authenticate associated data"));
    }

    std::vector<uint8_t> plaintext(ciphertextSize);
    int decryptedLen = 0;
    if (ciphertextSize > 0 &&
        EVP_DecryptUpdate(ctx, plaintext.data(), &decryptedLen,
                          sealed.data(), static_cast<int>(ciphertextSize)) != 1)
    {
        throw std::runtime_error(opensslError("Failed during decryption update"));
    }

    std::vector<uint8_t> tag(sealed.end() - GCM_TAG_SIZE, sealed.end());
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, GCM_TAG_SIZE, tag.data()) != 1)
    {
        throw std::runtime_error(opensslError("Failed to set authentication tag"));
    }

    int finalLen = 0;
    if (EVP_DecryptFinal_ex(ctx, plaintext.data() + decryptedLen, &finalLen) != 1)
    {
        ERR_clear_error();
        throw std::runtime_error("Authentication failed: data may have been tampered with");
    }

    plaintext.resize(decryptedLen + finalLen);
    return plaintext;
}

std::vector<uint8_t> Crypto::randomIV()
{
    std::vector<uint8_t> iv(GCM_IV_SIZE);
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1)
    {
        throw std::runtime_error(opensslError("Failed to generate random IV"));
    }
    return iv;
}

std::vector<uint8_t> Crypto::keyFromHex(const std::string &hex)
{
    if (hex.size() != KEY_SIZE * 2)
    {
        throw std::invalid_argument("Encryption key must be " + std::to_string(KEY_SIZE * 2) +
                                    " hex characters");
    }

    std::vector<uint8_t> key(KEY_SIZE);
    for (size_t i = 0; i < KEY_SIZE; ++i)
    {
        int high = hexValue(hex[2 * i]);
        int low = hexValue(hex[2 * i + 1]);
        if (high < 0 || low < 0)
        {
            throw std::invalid_argument("Encryption key contains a non-hex character");
        }
        key[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return key;
}
