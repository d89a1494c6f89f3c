#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "core/DeviceTransport.h"
#include "core/Logger.h"
#include "core/Records.h"

// Pulls one record snapshot from a device through the transport.
// Connection failures, command failures and responses that are not a
// sequence of records are logged and reported as nullopt. No retries.
class RecordSource {
public:
    RecordSource(DeviceTransport& transport, Logger& logger);

    std::optional<RecordSet> fetch(int64_t device_id, const std::string& command);

private:
    DeviceTransport& transport_;
    Logger& logger_;
};
