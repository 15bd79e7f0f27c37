#include "MultiCameraRecorder.hpp"
#include <QDateTime>
#include <algorithm>
#include "core/Logger.hpp"
#include "recorder/SegmentNamer.hpp"
#include "util/FileUtils.hpp"

namespace evc {

MultiCameraRecorder::MultiCameraRecorder(std::vector<CameraConfig> cameras,
                                         fs::path outputDirectory,
                                         EncoderBackendFactory backendFactory,
                                         SerialContext& context,
                                         CaptureSession& capture,
                                         Duration segmentDuration,
                                         QObject* parent)
    : QObject(parent),
      outputDirectory_(std::move(outputDirectory)),
      capture_(capture) {
    for (auto& cfg : cameras) {
        Camera cam;
        cam.controller = std::make_unique<SegmentedRecordingController>(
                cfg.id, backendFactory, context, this, segmentDuration);
        cam.controller->setEventSink(this);
        cam.config = std::move(cfg);
        cameras_.push_back(std::move(cam));
    }
    LOG_DEBUG("MultiCameraRecorder: {} cameras, output {}",
              cameras_.size(),
              outputDirectory_.string());
}

MultiCameraRecorder::~MultiCameraRecorder() {
    releaseAll();
}

usize MultiCameraRecorder::startAll(u32 width, u32 height) {
    auto res = file::ensureDir(outputDirectory_);
    if (res && !file::isWritableDir(outputDirectory_))
        res = Result<void>::err("Output directory is not writable: " +
                                outputDirectory_.string());
    if (!res) {
        LOG_ERROR("Cannot record: {}", res.error().message);
        for (const auto& cam : cameras_)
            recordingError.emitSignal(cam.config.id, res.error().message);
        return 0;
    }

    // One timestamp for all cameras so their files line up
    auto now = QDateTime::currentDateTime();
    usize started = 0;

    for (auto& cam : cameras_) {
        auto path = SegmentNamer::nextSegmentPath(
                outputDirectory_, cam.config.position, now);

        if (!cam.controller->prepare(path, width, height)) {
            LOG_WARN("Camera {}: not started (prepare failed)", cam.config.id);
            continue;
        }

        if (auto res = bindCurrentSurface(cam); !res) {
            LOG_ERROR("Camera {}: surface bind failed: {}",
                      cam.config.id,
                      res.error().message);
            cam.controller->release();
            recordingError.emitSignal(cam.config.id, res.error().message);
            continue;
        }

        if (!cam.controller->start()) {
            LOG_WARN("Camera {}: not started (start failed)", cam.config.id);
            unbind(cam);
            continue;
        }
        ++started;
    }

    LOG_INFO("Recording started on {}/{} cameras", started, cameras_.size());
    return started;
}

void MultiCameraRecorder::stopAll() {
    for (auto& cam : cameras_)
        cam.controller->stop();
}

void MultiCameraRecorder::releaseAll() {
    for (auto& cam : cameras_) {
        cam.controller->release();
        unbind(cam);
    }
}

usize MultiCameraRecorder::activeCameraCount() const {
    return std::count_if(cameras_.begin(), cameras_.end(), [](const auto& c) {
        return c.controller->isRecording() ||
               c.controller->awaitingReconfiguration();
    });
}

std::vector<std::string> MultiCameraRecorder::cameraIds() const {
    std::vector<std::string> ids;
    ids.reserve(cameras_.size());
    for (const auto& cam : cameras_)
        ids.push_back(cam.config.id);
    return ids;
}

SegmentedRecordingController* MultiCameraRecorder::controller(
        const std::string& cameraId) {
    auto* cam = find(cameraId);
    return cam ? cam->controller.get() : nullptr;
}

void MultiCameraRecorder::onRecordStart(const std::string& cameraId) {
    LOG_INFO("Camera {}: recording started", cameraId);
    recordingStarted.emitSignal(cameraId);
}

void MultiCameraRecorder::onSegmentSwitch(const std::string& cameraId,
                                          int newSegmentIndex) {
    auto* cam = find(cameraId);
    if (!cam)
        return;

    segmentSwitched.emitSignal(cameraId, newSegmentIndex);

    // Stopped while the event was queued
    if (!cam->controller->awaitingReconfiguration()) {
        LOG_DEBUG("Camera {}: segment {} no longer pending",
                  cameraId,
                  newSegmentIndex);
        return;
    }

    if (auto res = bindCurrentSurface(*cam); !res) {
        LOG_ERROR("Camera {}: rebind for segment {} failed: {}",
                  cameraId,
                  newSegmentIndex,
                  res.error().message);
        recordingError.emitSignal(cameraId, res.error().message);
        cam->controller->stop();
        return;
    }

    if (!cam->controller->start()) {
        LOG_ERROR("Camera {}: segment {} did not start",
                  cameraId,
                  newSegmentIndex);
    }
}

void MultiCameraRecorder::onRecordStop(const std::string& cameraId) {
    if (auto* cam = find(cameraId))
        unbindIfIdle(*cam);
    LOG_INFO("Camera {}: recording stopped", cameraId);
    recordingStopped.emitSignal(cameraId);
}

void MultiCameraRecorder::onRecordError(const std::string& cameraId,
                                        const std::string& message) {
    if (auto* cam = find(cameraId))
        unbindIfIdle(*cam);
    LOG_ERROR("Camera {}: {}", cameraId, message);
    recordingError.emitSignal(cameraId, message);
}

MultiCameraRecorder::Camera* MultiCameraRecorder::find(
        const std::string& cameraId) {
    auto it = std::find_if(cameras_.begin(), cameras_.end(), [&](auto& c) {
        return c.config.id == cameraId;
    });
    return it == cameras_.end() ? nullptr : &*it;
}

Result<void> MultiCameraRecorder::bindCurrentSurface(Camera& camera) {
    auto surface = camera.controller->inputSurface();
    if (!surface)
        return Result<void>::err("Recorder has no input surface");

    if (surface == camera.boundSurface)
        return Result<void>::ok();

    if (auto res = capture_.bindSurface(camera.config.id, surface); !res)
        return res;

    camera.boundSurface = std::move(surface);
    return Result<void>::ok();
}

// Events arrive queued; the camera may already be recording again
void MultiCameraRecorder::unbindIfIdle(Camera& camera) {
    if (camera.controller->state() != RecorderState::Idle) {
        LOG_DEBUG("Camera {}: restarted since the event, keeping surface",
                  camera.config.id);
        return;
    }
    unbind(camera);
}

void MultiCameraRecorder::unbind(Camera& camera) {
    if (!camera.boundSurface)
        return;
    capture_.unbindSurface(camera.config.id);
    camera.boundSurface.reset();
}

} // namespace evc
