#pragma once
// TestPatternCapture.hpp - Synthetic capture session
// Feeds a moving bar per camera into whichever surface is bound

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>
#include <map>
#include <mutex>
#include "recorder/InputSurface.hpp"
#include "session/CaptureSession.hpp"

namespace evc {

class TestPatternCapture : public QObject, public CaptureSession {
public:
    explicit TestPatternCapture(u32 fps = 30, QObject* parent = nullptr);
    ~TestPatternCapture() override;

    Result<void> bindSurface(const std::string& cameraId,
                             SurfaceHandle surface) override;
    void unbindSurface(const std::string& cameraId) override;

    SurfaceHandle boundSurface(const std::string& cameraId) const;
    usize boundCount() const;
    u64 framesPushed() const {
        return framesPushed_;
    }

    static VideoFrame renderFrame(u32 width,
                                  u32 height,
                                  u64 frameNumber,
                                  u32 cameraSeed,
                                  i64 timestampMs);

private:
    void onTick();

    struct Binding {
        SurfaceHandle surface;
        u32 seed{0};
    };

    QTimer timer_;
    QElapsedTimer clock_;
    mutable std::mutex mutex_;
    std::map<std::string, Binding> bindings_;
    u32 nextSeed_{0};
    u64 frameNumber_{0};
    u64 framesPushed_{0};
};

} // namespace evc
