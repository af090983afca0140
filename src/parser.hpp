#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include "model.hpp"

// Decode a store export into records.
// - jsonText: either [row, ...] or { "records": [row, ...] }
// - out:      decoded records, in file order (not sorted)
// - outError: readable error optionnal.
//
// Malformed rows are skipped, they never fail the whole payload.
// True in success
bool parse_timeline_payload(const std::string& jsonText, std::vector<EventRecord>& out, std::string* outError = nullptr);

// "2024-05-01T12:34:56.789Z", "+02:00" offsets, no zone = UTC. ms since epoch.
bool parse_iso8601_ms(const std::string& text, int64_t& outMs);

bool read_file(const std::string& path, std::string& out);
