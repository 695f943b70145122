#pragma once
#include <string>
#include <vector>
#include "stream/InMemoryStreamService.hpp"

namespace fixtures {

/// InMemoryStreamService that records lifecycle writes and can be told to fail them.
class RecordingStreamService : public InMemoryStreamService {
public:
    using InMemoryStreamService::InMemoryStreamService;

    struct EndCall {
        std::string commonId;
        TimePoint   endTime;
    };

    void createStream(const std::string& commonId, TimePoint obsStartTime) override {
        if (failCreate) throw PersistenceError("injected createStream failure");
        createCalls.push_back(commonId);
        InMemoryStreamService::createStream(commonId, obsStartTime);
    }

    void updateStreamEnd(const std::string& commonId, TimePoint obsEndTime) override {
        if (failUpdateEnd) throw PersistenceError("injected updateStreamEnd failure");
        endCalls.push_back({commonId, obsEndTime});
        InMemoryStreamService::updateStreamEnd(commonId, obsEndTime);
    }

    bool failCreate{false};
    bool failUpdateEnd{false};
    std::vector<std::string> createCalls;
    std::vector<EndCall> endCalls;
};

} // namespace fixtures
