#pragma once
// CaptureSession.hpp - The side that owns the cameras' pixel sinks
// Frames only reach an encoder after its surface has been bound here

#include <string>
#include "recorder/EncoderBackend.hpp"
#include "util/Result.hpp"

namespace evc {

class CaptureSession {
public:
    virtual ~CaptureSession() = default;

    // Replaces whatever surface the camera was feeding
    virtual Result<void> bindSurface(const std::string& cameraId,
                                     SurfaceHandle surface) = 0;
    virtual void unbindSurface(const std::string& cameraId) = 0;
};

} // namespace evc
