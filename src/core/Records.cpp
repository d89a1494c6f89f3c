#include "core/Records.h"

std::optional<RecordSet> decodeRecords(const nlohmann::json& response) {
    if (!response.is_array()) {
        return std::nullopt;
    }

    RecordSet records;
    records.reserve(response.size());

    for (const auto& item : response) {
        if (!item.is_object()) {
            return std::nullopt;
        }

        RawRecord record;
        for (auto it = item.begin(); it != item.end(); ++it) {
            const auto& value = it.value();
            if (value.is_string()) {
                record[it.key()] = value.get<std::string>();
            } else if (value.is_number() || value.is_boolean()) {
                record[it.key()] = value.dump();
            }
            // null, arrays and nested objects count as missing
        }
        records.push_back(std::move(record));
    }
    return records;
}

const std::string* findField(const RawRecord& record, const std::string& name) {
    auto it = record.find(name);
    if (it == record.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}
