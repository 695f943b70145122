#pragma once
#include <string>
#include "PlatformStream.hpp"
#include "util/Ids.hpp"

// One platform's view of a session. Immutable once stored; reassignment is remove + create.
struct PlatformStreamRecord {
    std::string    id;
    std::string    commonId;
    Platform       platform{Platform::Twitch};
    PlatformStream data;
    TimePoint      createdAt{};
};

inline PlatformStreamRecord makePlatformStreamRecord(std::string commonId,
                                                     PlatformStream data,
                                                     TimePoint createdAt = Clock::now()) {
    PlatformStreamRecord record;
    record.id        = generateUuid();
    record.commonId  = std::move(commonId);
    record.platform  = platformOf(data);
    record.data      = std::move(data);
    record.createdAt = createdAt;
    return record;
}
