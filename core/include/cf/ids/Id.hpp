#pragma once
#include <cstdint>
#include <string>

namespace cf {

// Element, asset and action identifiers are opaque strings (UUIDs from the
// client, or anything the caller chooses).
using ElementId = std::string;
using AssetId = std::string;
using ActionId = std::string;

// Fresh random RFC 4122 version-4 UUID string, e.g.
// "3f2a9c1e-7b4d-4e0a-9f6c-1d2e3f4a5b6c". Safe to call from any thread.
std::string generateUuid();

// Milliseconds since the Unix epoch.
std::int64_t nowMillis();

} // namespace cf
