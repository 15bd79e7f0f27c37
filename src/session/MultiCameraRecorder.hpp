/**
 * @file MultiCameraRecorder.hpp
 * @brief Owning session for one segmented recorder per camera.
 *
 * This file defines the MultiCameraRecorder class which creates a
 * SegmentedRecordingController for every configured camera, names the
 * first segment of each, and performs the surface rebinding each segment
 * switch asks for before restarting the camera's recorder.
 *
 * Events from the controllers arrive queued on this object's thread.
 *
 * @section Dependencies
 * - SegmentedRecordingController
 * - CaptureSession
 *
 * @section Patterns
 * - Mediator: sits between recorders and the capture session.
 * - Observer: re-emits recorder events through Signal members.
 */

#pragma once
#include <QObject>
#include <memory>
#include <vector>
#include "CaptureSession.hpp"
#include "core/ConfigData.hpp"
#include "recorder/RecordingEventSink.hpp"
#include "recorder/SegmentedRecordingController.hpp"
#include "util/Signal.hpp"

namespace evc {

class MultiCameraRecorder : public QObject, public RecordingEventSink {
public:
    MultiCameraRecorder(
            std::vector<CameraConfig> cameras,
            fs::path outputDirectory,
            EncoderBackendFactory backendFactory,
            SerialContext& context,
            CaptureSession& capture,
            Duration segmentDuration =
                    SegmentedRecordingController::kDefaultSegmentDuration,
            QObject* parent = nullptr);
    ~MultiCameraRecorder() override;

    // Returns the number of cameras that started
    usize startAll(u32 width, u32 height);
    void stopAll();
    void releaseAll();

    usize cameraCount() const {
        return cameras_.size();
    }
    usize activeCameraCount() const;
    std::vector<std::string> cameraIds() const;
    SegmentedRecordingController* controller(const std::string& cameraId);

    Signal<const std::string&> recordingStarted;
    Signal<const std::string&, int> segmentSwitched;
    Signal<const std::string&> recordingStopped;
    Signal<const std::string&, const std::string&> recordingError;

    void onRecordStart(const std::string& cameraId) override;
    void onSegmentSwitch(const std::string& cameraId,
                         int newSegmentIndex) override;
    void onRecordStop(const std::string& cameraId) override;
    void onRecordError(const std::string& cameraId,
                       const std::string& message) override;

private:
    struct Camera {
        CameraConfig config;
        std::unique_ptr<SegmentedRecordingController> controller;
        SurfaceHandle boundSurface;
    };

    Camera* find(const std::string& cameraId);
    Result<void> bindCurrentSurface(Camera& camera);
    void unbind(Camera& camera);
    void unbindIfIdle(Camera& camera);

    fs::path outputDirectory_;
    CaptureSession& capture_;
    std::vector<Camera> cameras_;
};

} // namespace evc
