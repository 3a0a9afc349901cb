#ifndef PRIORITY_LANES_HPP
#define PRIORITY_LANES_HPP

#include "WriteOperation.hpp"
#include <array>
#include <chrono>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Lanes in drain order: work that already failed once goes out first
enum class Lane
{
    Retry = 0,
    High = 1,
    Normal = 2,
    Bulk = 3,
};

Lane laneFor(WritePriority priority);

/**
 * @brief Retry/High/Normal/Bulk FIFO lanes with a dedup-key index
 *
 * At most one resident operation exists per dedup key across all lanes.
 * Not thread-safe; owners serialize access.
 */
class PriorityLanes
{
public:
    static constexpr size_t LANE_COUNT = 4;

    enum class InsertOutcome
    {
        Inserted,   // no resident operation shared the key
        Superseded, // an older resident operation was replaced
        Discarded,  // a newer resident operation already holds the key
    };

    PriorityLanes() = default;

    PriorityLanes(const PriorityLanes &) = delete;
    PriorityLanes &operator=(const PriorityLanes &) = delete;

    // Last write wins by admission sequence number
    InsertOutcome insert(WriteOperation op, Lane lane);

    // Removes up to maxCount operations: Retry, High, Normal, Bulk, FIFO within each
    std::vector<WriteOperation> take(size_t maxCount);

    std::vector<WriteOperation> drainAll();
    void clear();

    size_t size() const { return m_size; }
    size_t size(Lane lane) const { return m_lanes[static_cast<size_t>(lane)].size(); }
    bool empty() const { return m_size == 0; }

    bool containsKey(const std::string &dedupKey) const;
    const WriteOperation *findByKey(const std::string &dedupKey) const;

    // Earliest queuedAt among the lane heads
    std::optional<std::chrono::system_clock::time_point> oldestQueuedAt() const;

private:
    using LaneList = std::list<WriteOperation>;

    struct IndexEntry
    {
        Lane lane;
        LaneList::iterator position;
    };

    LaneList &laneList(Lane lane) { return m_lanes[static_cast<size_t>(lane)]; }
    void unindex(const WriteOperation &op);

    std::array<LaneList, LANE_COUNT> m_lanes;
    std::unordered_map<std::string, IndexEntry> m_dedupIndex;
    size_t m_size = 0;
};

#endif
