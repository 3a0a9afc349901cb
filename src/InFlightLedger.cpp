#include "InFlightLedger.hpp"
#include <stdexcept>

void InFlightLedger::track(std::shared_ptr<const WriteBatch> batch)
{
    if (!batch)
    {
        throw std::invalid_argument("Cannot track a null batch");
    }
    if (batch->operations.empty())
    {
        throw std::invalid_argument("Cannot track an empty batch: " + batch->batchId);
    }

    const std::string batchId = batch->batchId;
    if (!m_batches.try_emplace(batchId, Entry{std::move(batch), BatchState::InFlight}).second)
    {
        throw std::logic_error("Batch already in flight: " + batchId);
    }
}

std::shared_ptr<const WriteBatch> InFlightLedger::resolve(const std::string &batchId, BatchState outcome)
{
    if (outcome != BatchState::Committed && outcome != BatchState::Failed)
    {
        throw std::invalid_argument(std::string("Cannot resolve a batch to state ") + toString(outcome));
    }

    auto it = m_batches.find(batchId);
    if (it == m_batches.end())
    {
        return nullptr;
    }

    std::shared_ptr<const WriteBatch> batch = std::move(it->second.batch);
    m_batches.erase(it);
    return batch;
}

std::optional<BatchState> InFlightLedger::state(const std::string &batchId) const
{
    auto it = m_batches.find(batchId);
    if (it == m_batches.end())
    {
        return std::nullopt;
    }
    return it->second.state;
}

std::vector<std::string> InFlightLedger::batchIds() const
{
    std::vector<std::string> ids;
    ids.reserve(m_batches.size());
    for (const auto &[batchId, entry] : m_batches)
    {
        ids.push_back(batchId);
    }
    return ids;
}
