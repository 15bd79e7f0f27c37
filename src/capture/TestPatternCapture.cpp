#include "TestPatternCapture.hpp"
#include <algorithm>
#include <iterator>
#include "core/Logger.hpp"

namespace evc {

namespace {

struct Rgb {
    u8 r, g, b;
};

constexpr Rgb kTints[] = {
        {200, 40, 40}, {40, 160, 60}, {40, 80, 200}, {200, 160, 40}};

} // namespace

TestPatternCapture::TestPatternCapture(u32 fps, QObject* parent)
    : QObject(parent) {
    timer_.setTimerType(Qt::PreciseTimer);
    timer_.setInterval(1000 / std::max<u32>(fps, 1));
    connect(&timer_, &QTimer::timeout, this, [this] { onTick(); });
    clock_.start();
}

TestPatternCapture::~TestPatternCapture() {
    timer_.stop();
}

Result<void> TestPatternCapture::bindSurface(const std::string& cameraId,
                                             SurfaceHandle surface) {
    if (!surface)
        return Result<void>::err("Cannot bind a null surface for camera " +
                                 cameraId);
    if (!surface->isOpen())
        return Result<void>::err("Surface for camera " + cameraId +
                                 " is already closed");

    {
        std::lock_guard lock(mutex_);
        auto& binding = bindings_[cameraId];
        if (!binding.surface)
            binding.seed = nextSeed_++;
        binding.surface = std::move(surface);
    }
    LOG_DEBUG("TestPatternCapture: camera {} bound", cameraId);

    if (!timer_.isActive())
        timer_.start();
    return Result<void>::ok();
}

void TestPatternCapture::unbindSurface(const std::string& cameraId) {
    bool empty = false;
    {
        std::lock_guard lock(mutex_);
        bindings_.erase(cameraId);
        empty = bindings_.empty();
    }
    LOG_DEBUG("TestPatternCapture: camera {} unbound", cameraId);

    if (empty)
        timer_.stop();
}

SurfaceHandle TestPatternCapture::boundSurface(
        const std::string& cameraId) const {
    std::lock_guard lock(mutex_);
    auto it = bindings_.find(cameraId);
    return it == bindings_.end() ? SurfaceHandle{} : it->second.surface;
}

usize TestPatternCapture::boundCount() const {
    std::lock_guard lock(mutex_);
    return bindings_.size();
}

VideoFrame TestPatternCapture::renderFrame(u32 width,
                                           u32 height,
                                           u64 frameNumber,
                                           u32 cameraSeed,
                                           i64 timestampMs) {
    VideoFrame frame;
    frame.width = width;
    frame.height = height;
    frame.timestamp = timestampMs;
    frame.data.resize(static_cast<usize>(width) * height * 4);

    const Rgb tint = kTints[cameraSeed % std::size(kTints)];
    const u32 barWidth = std::max<u32>(width / 16, 1);
    const u32 barX = width ? static_cast<u32>((frameNumber * 8) % width) : 0;

    for (u32 y = 0; y < height; ++y) {
        u8* row = frame.data.data() + static_cast<usize>(y) * width * 4;
        const u8 shade = static_cast<u8>(height ? (y * 255) / height : 0);
        for (u32 x = 0; x < width; ++x) {
            u8* px = row + static_cast<usize>(x) * 4;
            bool onBar = x >= barX && x < barX + barWidth;
            px[0] = onBar ? 255 : static_cast<u8>((tint.r + shade) / 2);
            px[1] = onBar ? 255 : static_cast<u8>((tint.g + shade) / 2);
            px[2] = onBar ? 255 : static_cast<u8>((tint.b + shade) / 2);
            px[3] = 255;
        }
    }
    return frame;
}

void TestPatternCapture::onTick() {
    std::vector<Binding> targets;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, binding] : bindings_)
            targets.push_back(binding);
    }

    const u64 frameNumber = frameNumber_++;
    const i64 now = clock_.elapsed();
    for (const auto& target : targets) {
        auto frame = renderFrame(target.surface->width(),
                                 target.surface->height(),
                                 frameNumber,
                                 target.seed,
                                 now);
        if (target.surface->pushFrame(std::move(frame)))
            ++framesPushed_;
    }
}

} // namespace evc
