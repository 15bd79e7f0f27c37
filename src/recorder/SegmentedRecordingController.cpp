#include "SegmentedRecordingController.hpp"
#include "SegmentNamer.hpp"
#include "core/Logger.hpp"

namespace evc {

const char* toString(RecorderState state) {
    switch (state) {
    case RecorderState::Idle:
        return "Idle";
    case RecorderState::Prepared:
        return "Prepared";
    case RecorderState::Recording:
        return "Recording";
    case RecorderState::AwaitingReconfiguration:
        return "AwaitingReconfiguration";
    }
    return "Unknown";
}

const char* toString(RecordingErrorKind kind) {
    switch (kind) {
    case RecordingErrorKind::PrepareFailed:
        return "PrepareFailed";
    case RecordingErrorKind::StartFailed:
        return "StartFailed";
    case RecordingErrorKind::RotationFailed:
        return "RotationFailed";
    }
    return "Unknown";
}

template <typename Fn>
Result<void> SegmentedRecordingController::callBackend(const char* op,
                                                       Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return Result<void>::err(std::string("encoder ") + op +
                                 " threw: " + e.what());
    }
}

SegmentedRecordingController::SegmentedRecordingController(
        std::string cameraId,
        EncoderBackendFactory backendFactory,
        SerialContext& context,
        QObject* eventContext,
        Duration segmentDuration)
    : cameraId_(std::move(cameraId)),
      backendFactory_(std::move(backendFactory)),
      context_(context),
      eventContext_(eventContext),
      queuedEvents_(eventContext != nullptr),
      segmentDuration_(segmentDuration),
      timer_(std::make_unique<RotationTimer>(context, segmentDuration)) {
}

SegmentedRecordingController::~SegmentedRecordingController() {
    context_.invoke([this] {
        doRelease();
        timer_.reset();
    });
}

// ---------------------------------------------------------------------------
// Public operations, serialized on the control thread

bool SegmentedRecordingController::prepare(const fs::path& path,
                                           u32 width,
                                           u32 height) {
    return context_.call([&] { return doPrepare(path, width, height); });
}

bool SegmentedRecordingController::start() {
    return context_.call([this] { return doStart(); });
}

void SegmentedRecordingController::stop() {
    context_.invoke([this] { doStop(); });
}

void SegmentedRecordingController::release() {
    context_.invoke([this] { doRelease(); });
}

bool SegmentedRecordingController::prepareAndStart(const fs::path& path,
                                                   u32 width,
                                                   u32 height) {
    return context_.call([&] {
        return doPrepare(path, width, height) && doStart();
    });
}

void SegmentedRecordingController::clearAwaitingReconfiguration() {
    context_.invoke([this] { awaitingReconfiguration_ = false; });
}

RecorderState SegmentedRecordingController::state() const {
    return context_.call([this] { return stateLocked(); });
}

bool SegmentedRecordingController::isRecording() const {
    return context_.call([this] { return recording_; });
}

bool SegmentedRecordingController::awaitingReconfiguration() const {
    return context_.call([this] { return awaitingReconfiguration_; });
}

bool SegmentedRecordingController::rotationPending() const {
    return context_.call([this] { return timer_ && timer_->isPending(); });
}

int SegmentedRecordingController::segmentIndex() const {
    return context_.call([this] { return segmentIndex_; });
}

std::optional<fs::path> SegmentedRecordingController::currentFilePath() const {
    return context_.call([this] { return currentFilePath_; });
}

fs::path SegmentedRecordingController::saveDirectory() const {
    return context_.call([this] { return saveDirectory_; });
}

std::string SegmentedRecordingController::cameraPosition() const {
    return context_.call([this] { return cameraPosition_; });
}

SurfaceHandle SegmentedRecordingController::inputSurface() const {
    return context_.call([this] {
        return encoder_ ? encoder_->inputSurface() : SurfaceHandle{};
    });
}

// ---------------------------------------------------------------------------
// Transitions

bool SegmentedRecordingController::doPrepare(const fs::path& path,
                                             u32 width,
                                             u32 height) {
    if (auto current = stateLocked(); current != RecorderState::Idle) {
        LOG_WARN("Camera {}: prepare refused in state {}",
                 cameraId_,
                 toString(current));
        return false;
    }

    releaseEncoder();

    width_ = width;
    height_ = height;
    segmentIndex_ = 0;
    saveDirectory_ = SegmentNamer::saveDirectoryOf(path);
    cameraPosition_ = SegmentNamer::cameraPositionOf(path);

    if (auto res = createEncoder(path); !res) {
        LOG_ERROR("Camera {}: failed to prepare recording to {}: {}",
                  cameraId_,
                  path.string(),
                  res.error().message);
        releaseEncoder();
        resetToIdle();
        reportError(RecordingErrorKind::PrepareFailed, res.error().message);
        return false;
    }

    currentFilePath_ = path;
    LOG_DEBUG("Camera {}: prepared recording to {} ({}x{}, position '{}')",
              cameraId_,
              path.string(),
              width,
              height,
              cameraPosition_);
    return true;
}

bool SegmentedRecordingController::doStart() {
    if (!encoder_) {
        LOG_ERROR("Camera {}: encoder not prepared", cameraId_);
        return false;
    }
    if (recording_) {
        LOG_WARN("Camera {}: already recording", cameraId_);
        return false;
    }

    if (auto res = callBackend("start", [this] { return encoder_->start(); });
        !res) {
        LOG_ERROR("Camera {}: failed to start segment {}: {}",
                  cameraId_,
                  segmentIndex_,
                  res.error().message);
        releaseEncoder();
        resetToIdle();
        reportError(RecordingErrorKind::StartFailed, res.error().message);
        return false;
    }

    recording_ = true;
    awaitingReconfiguration_ = false;
    LOG_INFO("Camera {}: recording segment {} -> {}",
             cameraId_,
             segmentIndex_,
             currentFilePath_ ? currentFilePath_->string() : std::string());

    // Armed before the event so a stop from the sink cancels it
    timer_->schedule([this] { onSegmentTimeout(); });
    LOG_DEBUG("Camera {}: next segment in {} ms",
              cameraId_,
              segmentDuration_.count());

    if (segmentIndex_ == 0) {
        dispatch([id = cameraId_](RecordingEventSink& sink) {
            sink.onRecordStart(id);
        });
    }
    return true;
}

void SegmentedRecordingController::onSegmentTimeout() {
    if (!recording_)
        return;

    LOG_DEBUG("Camera {}: switching to next segment", cameraId_);

    stopEncoder("segment rotation");
    recording_ = false;
    LOG_DEBUG("Camera {}: stopped segment {}: {}",
              cameraId_,
              segmentIndex_,
              currentFilePath_ ? currentFilePath_->string() : std::string());
    releaseEncoder();

    ++segmentIndex_;
    auto nextPath = SegmentNamer::nextSegmentPath(saveDirectory_,
                                                  cameraPosition_);

    if (auto res = createEncoder(nextPath); !res) {
        LOG_ERROR("Camera {}: failed to switch to segment {}: {}",
                  cameraId_,
                  segmentIndex_,
                  res.error().message);
        timer_->cancel();
        releaseEncoder();
        resetToIdle();
        reportError(RecordingErrorKind::RotationFailed,
                    "Failed to switch segment: " + res.error().message);
        return;
    }

    currentFilePath_ = nextPath;
    awaitingReconfiguration_ = true;

    int index = segmentIndex_;
    dispatch([id = cameraId_, index](RecordingEventSink& sink) {
        sink.onSegmentSwitch(id, index);
    });
    LOG_DEBUG("Camera {}: prepared segment {}: {}, waiting for session "
              "reconfiguration",
              cameraId_,
              index,
              nextPath.string());
}

void SegmentedRecordingController::doStop() {
    timer_->cancel();

    if (awaitingReconfiguration_) {
        // The rotation already stopped the previous encoder
        LOG_DEBUG("Camera {}: stop while awaiting reconfiguration",
                  cameraId_);
        releaseEncoder();
        resetToIdle();
        dispatch([id = cameraId_](RecordingEventSink& sink) {
            sink.onRecordStop(id);
        });
        return;
    }

    if (!recording_) {
        LOG_DEBUG("Camera {}: stop ignored, not recording", cameraId_);
        return;
    }

    stopEncoder("stop");
    LOG_INFO("Camera {}: stopped recording: {} (total segments: {})",
             cameraId_,
             currentFilePath_ ? currentFilePath_->string() : std::string(),
             segmentIndex_ + 1);
    releaseEncoder();
    resetToIdle();
    dispatch([id = cameraId_](RecordingEventSink& sink) {
        sink.onRecordStop(id);
    });
}

void SegmentedRecordingController::doRelease() {
    if (recording_) {
        doStop();
        return;
    }

    if (timer_)
        timer_->cancel();
    releaseEncoder();
    resetToIdle();
}

// ---------------------------------------------------------------------------
// Helpers

Result<void> SegmentedRecordingController::createEncoder(const fs::path& path) {
    std::unique_ptr<EncoderBackend> encoder;
    try {
        encoder = backendFactory_ ? backendFactory_() : nullptr;
    } catch (const std::exception& e) {
        return Result<void>::err(std::string("Encoder backend creation "
                                             "failed: ") +
                                 e.what());
    }
    if (!encoder)
        return Result<void>::err("No encoder backend available");

    auto res = callBackend("prepare", [&] {
        return encoder->prepare(path, width_, height_);
    });
    if (!res) {
        try {
            encoder->release();
        } catch (const std::exception& e) {
            LOG_WARN("Camera {}: release after failed prepare threw: {}",
                     cameraId_,
                     e.what());
        }
        return res;
    }

    encoder_ = std::move(encoder);
    return Result<void>::ok();
}

void SegmentedRecordingController::stopEncoder(const char* reason) {
    if (!encoder_)
        return;
    if (auto res = callBackend("stop", [this] { return encoder_->stop(); });
        !res) {
        LOG_WARN("Camera {}: encoder stop failed during {}, treating as "
                 "stopped: {}",
                 cameraId_,
                 reason,
                 res.error().message);
    }
}

void SegmentedRecordingController::releaseEncoder() {
    if (!encoder_)
        return;
    try {
        encoder_->release();
    } catch (const std::exception& e) {
        LOG_WARN("Camera {}: encoder release threw: {}", cameraId_, e.what());
    }
    encoder_.reset();
}

void SegmentedRecordingController::resetToIdle() {
    recording_ = false;
    awaitingReconfiguration_ = false;
    segmentIndex_ = 0;
    currentFilePath_.reset();
    saveDirectory_.clear();
    cameraPosition_.clear();
    width_ = 0;
    height_ = 0;
}

RecorderState SegmentedRecordingController::stateLocked() const {
    if (recording_)
        return RecorderState::Recording;
    if (awaitingReconfiguration_)
        return RecorderState::AwaitingReconfiguration;
    if (encoder_)
        return RecorderState::Prepared;
    return RecorderState::Idle;
}

void SegmentedRecordingController::reportError(RecordingErrorKind kind,
                                               const std::string& message) {
    LOG_DEBUG("Camera {}: reporting {}", cameraId_, toString(kind));
    dispatch([id = cameraId_, message](RecordingEventSink& sink) {
        sink.onRecordError(id, message);
    });
}

void SegmentedRecordingController::dispatch(
        std::function<void(RecordingEventSink&)> event) {
    auto* sink = sink_;
    if (!sink)
        return;

    if (!queuedEvents_) {
        event(*sink);
        return;
    }
    if (!eventContext_) {
        LOG_WARN("Camera {}: event context gone, event dropped", cameraId_);
        return;
    }
    QMetaObject::invokeMethod(
            eventContext_.data(),
            [sink, event = std::move(event)] { event(*sink); },
            Qt::QueuedConnection);
}

} // namespace evc
