/*
Streamweave — Ids
Role: Generates the opaque identifiers used for stream commonIds, platform records and obs request ids.
Inputs/Outputs: None; returns RFC 4122 version 4 UUID strings.
Threading: Thread-safe; OpenSSL's RAND_bytes is safe for concurrent callers.
Integration: Default id source for ObsStreamDetector, StreamMatcher, InMemoryStreamService and ObsControlClient.
Related: Ids.cpp.
*/
#pragma once
#include <functional>
#include <string>

using IdGenerator = std::function<std::string()>;

/// Return a fresh lowercase UUIDv4 string. Throws if the CSPRNG fails.
[[nodiscard]] std::string generateUuid();
