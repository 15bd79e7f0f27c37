#pragma once
// RecordingEventSink.hpp - Lifecycle events a recorder reports to its owner

#include <string>

namespace evc {

class RecordingEventSink {
public:
    virtual ~RecordingEventSink() = default;

    // Once per session, when segment 0 starts writing
    virtual void onRecordStart(const std::string& cameraId) = 0;

    // A new segment is prepared; its surface must be rebound before start()
    virtual void onSegmentSwitch(const std::string& cameraId,
                                 int newSegmentIndex) = 0;

    virtual void onRecordStop(const std::string& cameraId) = 0;
    virtual void onRecordError(const std::string& cameraId,
                               const std::string& message) = 0;
};

} // namespace evc
