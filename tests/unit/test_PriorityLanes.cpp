#include <gtest/gtest.h>
#include "PriorityLanes.hpp"
#include <string>
#include <vector>

class PriorityLanesTest : public ::testing::Test
{
protected:
    WriteOperation makeOp(const std::string &id, WritePriority priority,
                          std::optional<std::string> key = std::nullopt)
    {
        WriteOperation op(id, WriteOpType::CreateEntry, std::vector<uint8_t>(id.begin(), id.end()), priority, std::move(key));
        op.sequence = nextSequence++;
        return op;
    }

    std::vector<std::string> ids(const std::vector<WriteOperation> &ops)
    {
        std::vector<std::string> result;
        for (const auto &op : ops)
        {
            result.push_back(op.opId);
        }
        return result;
    }

    PriorityLanes lanes;
    uint64_t nextSequence = 0;
};

TEST_F(PriorityLanesTest, TakeDrainsRetryThenHighNormalBulk)
{
    lanes.insert(makeOp("bulk-1", WritePriority::Bulk), Lane::Bulk);
    lanes.insert(makeOp("normal-1", WritePriority::Normal), Lane::Normal);
    lanes.insert(makeOp("high-1", WritePriority::High), Lane::High);
    lanes.insert(makeOp("retry-1", WritePriority::Bulk), Lane::Retry);
    lanes.insert(makeOp("high-2", WritePriority::High), Lane::High);

    EXPECT_EQ(lanes.size(), 5u);
    EXPECT_EQ(lanes.size(Lane::High), 2u);

    std::vector<WriteOperation> taken = lanes.take(10);
    EXPECT_EQ(ids(taken), (std::vector<std::string>{"retry-1", "high-1", "high-2", "normal-1", "bulk-1"}));
    EXPECT_TRUE(lanes.empty());
}

TEST_F(PriorityLanesTest, TakeRespectsLimitAndSpansLanes)
{
    lanes.insert(makeOp("high-1", WritePriority::High), Lane::High);
    lanes.insert(makeOp("normal-1", WritePriority::Normal), Lane::Normal);
    lanes.insert(makeOp("normal-2", WritePriority::Normal), Lane::Normal);

    EXPECT_EQ(ids(lanes.take(2)), (std::vector<std::string>{"high-1", "normal-1"}));
    EXPECT_EQ(lanes.size(), 1u);
    EXPECT_EQ(ids(lanes.take(2)), (std::vector<std::string>{"normal-2"}));
    EXPECT_TRUE(lanes.take(2).empty());
}

// A newer write for a key replaces the resident one wherever it lives
TEST_F(PriorityLanesTest, NewerWriteSupersedesAcrossLanes)
{
    EXPECT_EQ(lanes.insert(makeOp("v1", WritePriority::Bulk, std::string("k")), Lane::Retry),
              PriorityLanes::InsertOutcome::Inserted);
    EXPECT_EQ(lanes.insert(makeOp("v2", WritePriority::High, std::string("k")), Lane::High),
              PriorityLanes::InsertOutcome::Superseded);

    EXPECT_EQ(lanes.size(), 1u);
    EXPECT_EQ(lanes.size(Lane::Retry), 0u);
    ASSERT_NE(lanes.findByKey("k"), nullptr);
    EXPECT_EQ(lanes.findByKey("k")->opId, "v2");
}

TEST_F(PriorityLanesTest, OlderWriteIsDiscarded)
{
    WriteOperation older = makeOp("old", WritePriority::Normal, std::string("k"));
    WriteOperation newer = makeOp("new", WritePriority::Normal, std::string("k"));

    lanes.insert(std::move(newer), Lane::Normal);
    EXPECT_EQ(lanes.insert(std::move(older), Lane::Retry), PriorityLanes::InsertOutcome::Discarded);
    EXPECT_EQ(lanes.size(), 1u);
    EXPECT_EQ(lanes.findByKey("k")->opId, "new");
}

TEST_F(PriorityLanesTest, TakeRemovesKeysFromIndex)
{
    lanes.insert(makeOp("a", WritePriority::Normal, std::string("k")), Lane::Normal);
    EXPECT_TRUE(lanes.containsKey("k"));

    lanes.take(1);
    EXPECT_FALSE(lanes.containsKey("k"));

    // The key is free again after formation
    EXPECT_EQ(lanes.insert(makeOp("b", WritePriority::Normal, std::string("k")), Lane::Normal),
              PriorityLanes::InsertOutcome::Inserted);
}

TEST_F(PriorityLanesTest, DrainAllAndClearResetIndex)
{
    lanes.insert(makeOp("a", WritePriority::High, std::string("k1")), Lane::High);
    lanes.insert(makeOp("b", WritePriority::Bulk, std::string("k2")), Lane::Bulk);
    lanes.insert(makeOp("c", WritePriority::Normal), Lane::Retry);

    std::vector<WriteOperation> drained = lanes.drainAll();
    EXPECT_EQ(drained.size(), 3u);
    EXPECT_TRUE(lanes.empty());
    EXPECT_FALSE(lanes.containsKey("k1"));

    lanes.insert(makeOp("d", WritePriority::High, std::string("k1")), Lane::High);
    lanes.clear();
    EXPECT_EQ(lanes.size(), 0u);
    EXPECT_FALSE(lanes.containsKey("k1"));
    EXPECT_FALSE(lanes.oldestQueuedAt().has_value());
}

TEST_F(PriorityLanesTest, OldestQueuedAtLooksAtLaneHeads)
{
    WriteOperation early = makeOp("early", WritePriority::Bulk);
    early.queuedAt -= std::chrono::seconds(10);
    WriteOperation late = makeOp("late", WritePriority::High);

    const auto earlyTime = early.queuedAt;
    lanes.insert(std::move(late), Lane::High);
    lanes.insert(std::move(early), Lane::Bulk);

    ASSERT_TRUE(lanes.oldestQueuedAt().has_value());
    EXPECT_EQ(*lanes.oldestQueuedAt(), earlyTime);
}

TEST(LaneForTest, MapsPrioritiesAndRejectsInvalid)
{
    EXPECT_EQ(laneFor(WritePriority::High), Lane::High);
    EXPECT_EQ(laneFor(WritePriority::Normal), Lane::Normal);
    EXPECT_EQ(laneFor(WritePriority::Bulk), Lane::Bulk);
    EXPECT_THROW(laneFor(static_cast<WritePriority>(9)), std::invalid_argument);
}
