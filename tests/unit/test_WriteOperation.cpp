#include <gtest/gtest.h>
#include "WriteOperation.hpp"
#include <chrono>
#include <stdexcept>

// Test that the constructor stamps the queue time and leaves retry state clean
TEST(WriteOperationTest, ConstructorInitializesFields)
{
    auto before = std::chrono::system_clock::now();
    WriteOperation op("op-1", WriteOpType::UpdateEntry, {1, 2, 3}, WritePriority::High, std::string("hash-1"));
    auto after = std::chrono::system_clock::now();

    EXPECT_EQ(op.opId, "op-1");
    EXPECT_EQ(op.opType, WriteOpType::UpdateEntry);
    EXPECT_EQ(op.payload, (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ(op.priority, WritePriority::High);
    ASSERT_TRUE(op.dedupKey.has_value());
    EXPECT_EQ(*op.dedupKey, "hash-1");
    EXPECT_EQ(op.retryCount, 0u);
    EXPECT_GE(op.queuedAt, before);
    EXPECT_LE(op.queuedAt, after);
}

TEST(WriteOperationTest, PriorityNamesRoundTrip)
{
    for (WritePriority priority : {WritePriority::High, WritePriority::Normal, WritePriority::Bulk})
    {
        EXPECT_EQ(parsePriority(toString(priority)), priority);
    }
    EXPECT_EQ(parsePriority("BULK"), WritePriority::Bulk);
    EXPECT_EQ(parsePriority("high"), WritePriority::High);
}

TEST(WriteOperationTest, OpTypeNamesRoundTrip)
{
    for (WriteOpType opType : {WriteOpType::CreateEntry, WriteOpType::UpdateEntry, WriteOpType::DeleteEntry,
                               WriteOpType::CreateLink, WriteOpType::DeleteLink})
    {
        EXPECT_EQ(parseOpType(toString(opType)), opType);
    }
    EXPECT_EQ(parseOpType("createlink"), WriteOpType::CreateLink);
}

// Unknown names fail fast instead of being coerced
TEST(WriteOperationTest, UnknownNamesThrow)
{
    EXPECT_THROW(parsePriority("urgent"), std::invalid_argument);
    EXPECT_THROW(parsePriority(""), std::invalid_argument);
    EXPECT_THROW(parseOpType("UpsertEntry"), std::invalid_argument);
}

TEST(WriteOperationTest, ValidateRejectsOutOfRangeValues)
{
    EXPECT_NO_THROW(validatePriority(WritePriority::Bulk));
    EXPECT_NO_THROW(validateOpType(WriteOpType::DeleteLink));
    EXPECT_THROW(validatePriority(static_cast<WritePriority>(7)), std::invalid_argument);
    EXPECT_THROW(validateOpType(static_cast<WriteOpType>(42)), std::invalid_argument);
}

TEST(WriteOperationTest, BatchStateNames)
{
    EXPECT_STREQ(toString(BatchState::Pending), "Pending");
    EXPECT_STREQ(toString(BatchState::InFlight), "InFlight");
    EXPECT_STREQ(toString(BatchState::Committed), "Committed");
    EXPECT_STREQ(toString(BatchState::Failed), "Failed");
}
