#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "core/ConnectionStatsAggregator.h"
#include "core/DhcpStatsAggregator.h"

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.000Z
std::string formatIso8601(std::chrono::system_clock::time_point tp);

// Presentation shape, camelCase field names
nlohmann::json toJson(const ConnectionSummary& summary);
nlohmann::json toJson(const LeaseSummary& summary);
