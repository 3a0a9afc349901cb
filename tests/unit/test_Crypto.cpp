#include <gtest/gtest.h>
#include "Crypto.hpp"
#include <string>
#include <vector>
#include <stdexcept>

class CryptoTest : public ::testing::Test
{
protected:
    // Helper method to create a random key of proper size
    std::vector<uint8_t> createRandomKey()
    {
        std::vector<uint8_t> key(Crypto::KEY_SIZE);
        for (size_t i = 0; i < key.size(); ++i)
        {
            key[i] = static_cast<uint8_t>(rand() % 256);
        }
        return key;
    }

    std::vector<uint8_t> stringToBytes(const std::string &str)
    {
        return std::vector<uint8_t>(str.begin(), str.end());
    }

    void SetUp() override
    {
        srand(42);
        key = createRandomKey();
        iv = Crypto::randomIV();
    }

    std::vector<uint8_t> key;
    std::vector<uint8_t> iv;
};

// Empty plaintext still produces an authentication tag
TEST_F(CryptoTest, EmptyData)
{
    std::vector<uint8_t> sealed = Crypto::encrypt({}, key, iv);
    EXPECT_EQ(sealed.size(), Crypto::GCM_TAG_SIZE);
    EXPECT_TRUE(Crypto::decrypt(sealed, key, iv).empty());
}

TEST_F(CryptoTest, EncryptDecryptWithAad)
{
    std::vector<uint8_t> plaintext = stringToBytes("queued operations snapshot");
    std::vector<uint8_t> aad = stringToBytes("header");

    std::vector<uint8_t> sealed = Crypto::encrypt(plaintext, key, iv, aad);
    EXPECT_EQ(sealed.size(), plaintext.size() + Crypto::GCM_TAG_SIZE);
    EXPECT_NE(std::vector<uint8_t>(sealed.begin(), sealed.begin() + plaintext.size()), plaintext);

    EXPECT_EQ(Crypto::decrypt(sealed, key, iv, aad), plaintext);
}

TEST_F(CryptoTest, LargeData)
{
    std::vector<uint8_t> plaintext(1024 * 1024);
    for (size_t i = 0; i < plaintext.size(); ++i)
    {
        plaintext[i] = static_cast<uint8_t>(i % 251);
    }
    EXPECT_EQ(Crypto::decrypt(Crypto::encrypt(plaintext, key, iv), key, iv), plaintext);
}

TEST_F(CryptoTest, TamperedCiphertextFailsAuthentication)
{
    std::vector<uint8_t> sealed = Crypto::encrypt(stringToBytes("payload"), key, iv);
    sealed[0] ^= 0x01;
    EXPECT_THROW(Crypto::decrypt(sealed, key, iv), std::runtime_error);
}

TEST_F(CryptoTest, TamperedAadFailsAuthentication)
{
    std::vector<uint8_t> sealed = Crypto::encrypt(stringToBytes("payload"), key, iv, stringToBytes("v1"));
    EXPECT_THROW(Crypto::decrypt(sealed, key, iv, stringToBytes("v2")), std::runtime_error);
    EXPECT_THROW(Crypto::decrypt(sealed, key, iv), std::runtime_error);
}

TEST_F(CryptoTest, WrongKeyFailsAuthentication)
{
    std::vector<uint8_t> sealed = Crypto::encrypt(stringToBytes("payload"), key, iv);
    std::vector<uint8_t> otherKey = createRandomKey();
    EXPECT_THROW(Crypto::decrypt(sealed, otherKey, iv), std::runtime_error);
}

TEST_F(CryptoTest, InvalidSizesThrow)
{
    std::vector<uint8_t> shortKey(16, 0x01);
    std::vector<uint8_t> shortIV(8, 0x02);
    EXPECT_THROW(Crypto::encrypt(stringToBytes("x"), shortKey, iv), std::runtime_error);
    EXPECT_THROW(Crypto::encrypt(stringToBytes("x"), key, shortIV), std::runtime_error);
    EXPECT_THROW(Crypto::decrypt(std::vector<uint8_t>(4, 0), key, iv), std::runtime_error);
}

TEST_F(CryptoTest, RandomIVsDiffer)
{
    std::vector<uint8_t> first = Crypto::randomIV();
    std::vector<uint8_t> second = Crypto::randomIV();
    EXPECT_EQ(first.size(), Crypto::GCM_IV_SIZE);
    EXPECT_NE(first, second);
}

TEST_F(CryptoTest, KeyFromHex)
{
    std::string hex = "000102030405060708090a0b0c0d0e0f"
                      "F0F1F2F3F4F5F6F7F8F9FAFBFCFDFEFF";
    std::vector<uint8_t> parsed = Crypto::keyFromHex(hex);
    ASSERT_EQ(parsed.size(), Crypto::KEY_SIZE);
    EXPECT_EQ(parsed[0], 0x00);
    EXPECT_EQ(parsed[15], 0x0f);
    EXPECT_EQ(parsed[16], 0xf0);
    EXPECT_EQ(parsed[31], 0xff);

    EXPECT_THROW(Crypto::keyFromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Crypto::keyFromHex(std::string(64, 'g')), std::invalid_argument);
}
