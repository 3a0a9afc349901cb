#ifndef IN_FLIGHT_LEDGER_HPP
#define IN_FLIGHT_LEDGER_HPP

#include "WriteOperation.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Batches handed to a flush callback whose outcome is not yet reconciled
class InFlightLedger
{
public:
    InFlightLedger() = default;

    InFlightLedger(const InFlightLedger &) = delete;
    InFlightLedger &operator=(const InFlightLedger &) = delete;

    // Pending -> InFlight; throws std::logic_error if the id is already tracked
    void track(std::shared_ptr<const WriteBatch> batch);

    // InFlight -> Committed/Failed and removal; nullptr if the id is unknown
    std::shared_ptr<const WriteBatch> resolve(const std::string &batchId, BatchState outcome);

    std::optional<BatchState> state(const std::string &batchId) const;
    std::vector<std::string> batchIds() const;
    size_t size() const { return m_batches.size(); }
    void clear() { m_batches.clear(); }

private:
    struct Entry
    {
        std::shared_ptr<const WriteBatch> batch;
        BatchState state;
    };

    std::unordered_map<std::string, Entry> m_batches;
};

#endif
