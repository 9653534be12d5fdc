#pragma once

#include <filesystem>
#include <functional>
#include <optional>

#include "core/HardwareStorageQuery.hpp"
#include "core/PerformanceProbe.hpp"

namespace evidhash::test {

/// Hardware query returning canned reports and counting calls
class FakeQuery : public IHardwareStorageQuery {
public:
    std::optional<HardwareReport> device;
    std::optional<MediaReport> media;
    // Overrides `device` when set; receives the volume root
    std::function<std::optional<HardwareReport>(const std::filesystem::path&)> devicePerVolume;
    int deviceCalls{0};
    int mediaCalls{0};

    std::optional<HardwareReport> queryDevice(const std::filesystem::path& volume) override {
        ++deviceCalls;
        if (devicePerVolume) return devicePerVolume(volume);
        return device;
    }
    std::optional<MediaReport> queryMediaType(const std::filesystem::path&) override {
        ++mediaCalls;
        return media;
    }
    const char* platformName() const override { return "fake"; }
};

/// Probe returning a fixed measurement, or an error when unset
class FakeProbe : public IPerformanceProbe {
public:
    std::optional<ProbeMeasurement> measurement;
    int calls{0};
    size_t lastBytes{0};

    Expected<ProbeMeasurement> measure(const std::filesystem::path&, size_t bytes) override {
        ++calls;
        lastBytes = bytes;
        if (!measurement) return Error{ErrorCode::DetectionFailed, "probe disabled"};
        return *measurement;
    }
};

inline HardwareReport solidStateOn(BusType bus) {
    HardwareReport r;
    r.seekPenalty = false;
    r.busType = bus;
    return r;
}

inline HardwareReport rotatingOn(BusType bus) {
    HardwareReport r;
    r.seekPenalty = true;
    r.busType = bus;
    return r;
}

}
