#include "WriteOperation.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace
{
    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

const char *toString(WritePriority priority)
{
    switch (priority)
    {
    case WritePriority::High:
        return "High";
    case WritePriority::Normal:
        return "Normal";
    case WritePriority::Bulk:
        return "Bulk";
    }
    return "Unknown";
}

const char *toString(WriteOpType opType)
{
    switch (opType)
    {
    case WriteOpType::CreateEntry:
        return "CreateEntry";
    case WriteOpType::UpdateEntry:
        return "UpdateEntry";
    case WriteOpType::DeleteEntry:
        return "DeleteEntry";
    case WriteOpType::CreateLink:
        return "CreateLink";
    case WriteOpType::DeleteLink:
        return "DeleteLink";
    }
    return "Unknown";
}

const char *toString(BatchState state)
{
    switch (state)
    {
    case BatchState::Pending:
        return "Pending";
    case BatchState::InFlight:
        return "InFlight";
    case BatchState::Committed:
        return "Committed";
    case BatchState::Failed:
        return "Failed";
    }
    return "Unknown";
}

WritePriority parsePriority(const std::string &name)
{
    const std::string lowered = toLower(name);
    if (lowered == "high")
        return WritePriority::High;
    if (lowered == "normal")
        return WritePriority::Normal;
    if (lowered == "bulk")
        return WritePriority::Bulk;
    throw std::invalid_argument("Unknown write priority: '" + name + "'");
}

WriteOpType parseOpType(const std::string &name)
{
    const std::string lowered = toLower(name);
    if (lowered == "createentry")
        return WriteOpType::CreateEntry;
    if (lowered == "updateentry")
        return WriteOpType::UpdateEntry;
    if (lowered == "deleteentry")
        return WriteOpType::DeleteEntry;
    if (lowered == "createlink")
        return WriteOpType::CreateLink;
    if (lowered == "deletelink")
        return WriteOpType::DeleteLink;
    throw std::invalid_argument("Unknown write operation type: '" + name + "'");
}

void validatePriority(WritePriority priority)
{
    if (static_cast<uint8_t>(priority) > static_cast<uint8_t>(WritePriority::Bulk))
    {
        throw std::invalid_argument("Invalid write priority value: " +
                                    std::to_string(static_cast<int>(priority)));
    }
}

void validateOpType(WriteOpType opType)
{
    if (static_cast<uint8_t>(opType) > static_cast<uint8_t>(WriteOpType::DeleteLink))
    {
        throw std::invalid_argument("Invalid write operation type value: " +
                                    std::to_string(static_cast<int>(opType)));
    }
}
