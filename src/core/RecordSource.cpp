#include "core/RecordSource.h"

RecordSource::RecordSource(DeviceTransport& transport, Logger& logger)
    : transport_(transport), logger_(logger) {}

std::optional<RecordSet> RecordSource::fetch(int64_t device_id, const std::string& command) {
    const std::string device = "device " + std::to_string(device_id);

    try {
        if (!transport_.connect(device_id)) {
            logger_.warn("Cannot connect to " + device + " for " + command);
            return std::nullopt;
        }

        auto session = transport_.getSession(device_id);
        if (!session) {
            logger_.warn("No session available for " + device);
            return std::nullopt;
        }

        nlohmann::json response = session->query(command);
        auto records = decodeRecords(response);
        if (!records) {
            logger_.warn("Malformed response from " + device + " for " + command +
                         ": expected an array of records, got " + response.type_name());
            return std::nullopt;
        }

        logger_.debug("Fetched " + std::to_string(records->size()) + " records from " +
                      device + " (" + command + ")");
        return records;

    } catch (const DeviceError& e) {
        logger_.warn("Command " + command + " failed on " + device + ": " + e.what());
    } catch (const nlohmann::json::exception& e) {
        logger_.warn("Bad response from " + device + " for " + command + ": " + e.what());
    } catch (const std::exception& e) {
        logger_.warn("Transport error on " + device + ": " + e.what());
    }
    return std::nullopt;
}
