#include "PriorityLanes.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

Lane laneFor(WritePriority priority)
{
    switch (priority)
    {
    case WritePriority::High:
        return Lane::High;
    case WritePriority::Normal:
        return Lane::Normal;
    case WritePriority::Bulk:
        return Lane::Bulk;
    }
    throw std::invalid_argument("Invalid write priority value: " +
                                std::to_string(static_cast<int>(priority)));
}

PriorityLanes::InsertOutcome PriorityLanes::insert(WriteOperation op, Lane lane)
{
    InsertOutcome outcome = InsertOutcome::Inserted;

    if (op.dedupKey)
    {
        auto it = m_dedupIndex.find(*op.dedupKey);
        if (it != m_dedupIndex.end())
        {
            const IndexEntry resident = it->second;
            if (resident.position->sequence > op.sequence)
            {
                return InsertOutcome::Discarded;
            }
            laneList(resident.lane).erase(resident.position);
            m_dedupIndex.erase(it);
            --m_size;
            outcome = InsertOutcome::Superseded;
        }
    }

    LaneList &target = laneList(lane);
    target.push_back(std::move(op));
    ++m_size;

    const WriteOperation &stored = target.back();
    if (stored.dedupKey)
    {
        m_dedupIndex.emplace(*stored.dedupKey, IndexEntry{lane, std::prev(target.end())});
    }
    return outcome;
}

std::vector<WriteOperation> PriorityLanes::take(size_t maxCount)
{
    std::vector<WriteOperation> taken;
    taken.reserve(std::min(maxCount, m_size));

    for (auto &lane : m_lanes)
    {
        while (!lane.empty() && taken.size() < maxCount)
        {
            unindex(lane.front());
            taken.push_back(std::move(lane.front()));
            lane.pop_front();
            --m_size;
        }
        if (taken.size() == maxCount)
        {
            break;
        }
    }
    return taken;
}

std::vector<WriteOperation> PriorityLanes::drainAll()
{
    std::vector<WriteOperation> drained;
    drained.reserve(m_size);
    for (auto &lane : m_lanes)
    {
        for (auto &op : lane)
        {
            drained.push_back(std::move(op));
        }
        lane.clear();
    }
    m_dedupIndex.clear();
    m_size = 0;
    return drained;
}

void PriorityLanes::clear()
{
    for (auto &lane : m_lanes)
    {
        lane.clear();
    }
    m_dedupIndex.clear();
    m_size = 0;
}

bool PriorityLanes::containsKey(const std::string &dedupKey) const
{
    return m_dedupIndex.find(dedupKey) != m_dedupIndex.end();
}

const WriteOperation *PriorityLanes::findByKey(const std::string &dedupKey) const
{
    auto it = m_dedupIndex.find(dedupKey);
    if (it == m_dedupIndex.end())
    {
        return nullptr;
    }
    return &*it->second.position;
}

std::optional<std::chrono::system_clock::time_point> PriorityLanes::oldestQueuedAt() const
{
    std::optional<std::chrono::system_clock::time_point> oldest;
    for (const auto &lane : m_lanes)
    {
        if (!lane.empty() && (!oldest || lane.front().queuedAt < *oldest))
        {
            oldest = lane.front().queuedAt;
        }
    }
    return oldest;
}

void PriorityLanes::unindex(const WriteOperation &op)
{
    if (op.dedupKey)
    {
        m_dedupIndex.erase(*op.dedupKey);
    }
}
