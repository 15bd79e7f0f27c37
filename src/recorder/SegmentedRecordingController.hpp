/**
 * @file SegmentedRecordingController.hpp
 * @brief Rolling, fixed-duration segment recording for one camera.
 *
 * This file defines the SegmentedRecordingController class which drives a
 * sequence of EncoderBackend instances, one per output file. When a segment
 * times out the controller stops and releases the current encoder, prepares
 * the next one and halts in AwaitingReconfiguration: the new encoder has a
 * new input surface, and only the owning capture session may rebind it.
 * The owner does that and calls start() again.
 *
 * State transitions run on the injected SerialContext. Public methods may
 * be called from any thread; they block until the transition has run.
 * Events go to the RecordingEventSink through queued calls on the event
 * context (or inline on the control thread when none is given), in the
 * order the transitions happened.
 *
 * @section Dependencies
 * - EncoderBackend
 * - RotationTimer
 * - SegmentNamer
 * - SerialContext
 *
 * @section Patterns
 * - State Machine: Idle -> Prepared -> Recording <-> AwaitingReconfiguration.
 * - Observer: RecordingEventSink receives lifecycle events.
 */

#pragma once
#include <QObject>
#include <QPointer>
#include <memory>
#include <optional>
#include <string>
#include "EncoderBackend.hpp"
#include "RecordingEventSink.hpp"
#include "RotationTimer.hpp"
#include "core/SerialContext.hpp"
#include "util/Result.hpp"

namespace evc {

enum class RecorderState { Idle, Prepared, Recording, AwaitingReconfiguration };

enum class RecordingErrorKind { PrepareFailed, StartFailed, RotationFailed };

const char* toString(RecorderState state);
const char* toString(RecordingErrorKind kind);

class SegmentedRecordingController {
public:
    static constexpr Duration kDefaultSegmentDuration{60000};

    SegmentedRecordingController(std::string cameraId,
                                 EncoderBackendFactory backendFactory,
                                 SerialContext& context,
                                 QObject* eventContext = nullptr,
                                 Duration segmentDuration =
                                         kDefaultSegmentDuration);
    ~SegmentedRecordingController();

    SegmentedRecordingController(const SegmentedRecordingController&) = delete;
    SegmentedRecordingController& operator=(
            const SegmentedRecordingController&) = delete;

    // Not thread-safe; set before the first prepare()
    void setEventSink(RecordingEventSink* sink) {
        sink_ = sink;
    }

    bool prepare(const fs::path& path, u32 width, u32 height);
    bool start();
    void stop();
    void release();

    bool prepareAndStart(const fs::path& path, u32 width, u32 height);

    // Drops the awaiting flag; the prepared encoder stays held
    void clearAwaitingReconfiguration();

    const std::string& cameraId() const {
        return cameraId_;
    }
    Duration segmentDuration() const {
        return segmentDuration_;
    }

    RecorderState state() const;
    bool isRecording() const;
    bool awaitingReconfiguration() const;
    bool rotationPending() const;
    int segmentIndex() const;
    std::optional<fs::path> currentFilePath() const;
    fs::path saveDirectory() const;
    std::string cameraPosition() const;
    SurfaceHandle inputSurface() const;

private:
    bool doPrepare(const fs::path& path, u32 width, u32 height);
    bool doStart();
    void doStop();
    void doRelease();
    void onSegmentTimeout();

    Result<void> createEncoder(const fs::path& path);
    void stopEncoder(const char* reason);
    void releaseEncoder();
    void resetToIdle();
    RecorderState stateLocked() const;

    template <typename Fn>
    Result<void> callBackend(const char* op, Fn&& fn);

    void reportError(RecordingErrorKind kind, const std::string& message);
    void dispatch(std::function<void(RecordingEventSink&)> event);

    const std::string cameraId_;
    const EncoderBackendFactory backendFactory_;
    SerialContext& context_;
    QPointer<QObject> eventContext_;
    const bool queuedEvents_;
    const Duration segmentDuration_;
    RecordingEventSink* sink_{nullptr};

    // Touched only on the context thread
    std::unique_ptr<EncoderBackend> encoder_;
    std::unique_ptr<RotationTimer> timer_;
    bool recording_{false};
    bool awaitingReconfiguration_{false};
    int segmentIndex_{0};
    std::optional<fs::path> currentFilePath_;
    fs::path saveDirectory_;
    std::string cameraPosition_;
    u32 width_{0};
    u32 height_{0};
};

} // namespace evc
