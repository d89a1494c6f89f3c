#pragma once
#include <map>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

// One record as returned by the device: field name -> raw string value.
// Any field may be missing.
using RawRecord = std::map<std::string, std::string>;
using RecordSet = std::vector<RawRecord>;

// Convert a device response into records.
// Returns nullopt unless the response is an array of objects.
// Scalar values are stringified; null and nested values are dropped.
std::optional<RecordSet> decodeRecords(const nlohmann::json& response);

// Field lookup; nullptr when the field is missing or empty
const std::string* findField(const RawRecord& record, const std::string& name);
