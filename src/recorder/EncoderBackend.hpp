/**
 * @file EncoderBackend.hpp
 * @brief Capability interface around one hardware/software video encoder.
 *
 * An EncoderBackend instance encodes exactly one output file. It is
 * prepared against a path, started, stopped and released; after release it
 * is never reused. Every prepared instance exposes its own input surface,
 * and surfaces of two instances are never the same object, so callers
 * compare handles by identity to detect that the capture pipeline has to
 * be rebound.
 *
 * @section Patterns
 * - Strategy: the recorder drives any backend through this interface.
 * - Factory: a fresh backend is created per segment.
 */

#pragma once
#include <functional>
#include <memory>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace evc {

class InputSurface;

// Opaque identity of an encoder input. Compare with ==.
using SurfaceHandle = std::shared_ptr<InputSurface>;

class EncoderBackend {
public:
    virtual ~EncoderBackend() = default;

    virtual Result<void> prepare(const fs::path& outputPath,
                                 u32 width,
                                 u32 height) = 0;
    virtual Result<void> start() = 0;

    // Best-effort. Callers treat any error as "already stopped".
    virtual Result<void> stop() = 0;

    // Idempotent, never fails observably.
    virtual void release() = 0;

    virtual SurfaceHandle inputSurface() const = 0;
};

using EncoderBackendFactory = std::function<std::unique_ptr<EncoderBackend>()>;

} // namespace evc
