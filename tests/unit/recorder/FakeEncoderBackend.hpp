#pragma once
// FakeEncoderBackend.hpp - Scriptable EncoderBackend for recorder tests
// Every instance shares one FakeBackendLog so tests can inspect the whole
// sequence of backend calls across segments.

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "recorder/EncoderBackend.hpp"
#include "recorder/InputSurface.hpp"

namespace evc::test {

class FakeBackendLog {
public:
    // Failure switches; prepare failures can target the Nth prepare (0-based)
    bool failStart{false};
    bool failStop{false};
    bool throwPrepare{false};
    int failPrepareAt{-1};
    bool failEveryPrepare{false};

    void record(const std::string& call) {
        std::lock_guard lock(mutex_);
        calls_.push_back(call);
    }

    void recordPrepare(const fs::path& path) {
        std::lock_guard lock(mutex_);
        calls_.push_back("prepare");
        paths_.push_back(path);
    }

    std::vector<std::string> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    std::vector<fs::path> preparedPaths() const {
        std::lock_guard lock(mutex_);
        return paths_;
    }

    int count(const std::string& call) const {
        std::lock_guard lock(mutex_);
        int n = 0;
        for (const auto& c : calls_)
            n += (c == call);
        return n;
    }

    int instances() const {
        std::lock_guard lock(mutex_);
        return instances_;
    }

    int nextInstance() {
        std::lock_guard lock(mutex_);
        return instances_++;
    }

    int nextPrepare() {
        std::lock_guard lock(mutex_);
        return prepares_++;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
    std::vector<fs::path> paths_;
    int instances_{0};
    int prepares_{0};
};

class FakeEncoderBackend : public EncoderBackend {
public:
    explicit FakeEncoderBackend(std::shared_ptr<FakeBackendLog> log)
        : log_(std::move(log)) {
        log_->nextInstance();
    }

    Result<void> prepare(const fs::path& outputPath,
                         u32 width,
                         u32 height) override {
        log_->recordPrepare(outputPath);
        int n = log_->nextPrepare();
        if (log_->throwPrepare)
            throw std::runtime_error("codec exploded");
        if (log_->failEveryPrepare || n == log_->failPrepareAt)
            return Result<void>::err("no encoder for " + outputPath.string());

        surface_ = std::make_shared<InputSurface>(width, height);
        return Result<void>::ok();
    }

    Result<void> start() override {
        log_->record("start");
        if (log_->failStart)
            return Result<void>::err("encoder refused to start");
        return Result<void>::ok();
    }

    Result<void> stop() override {
        log_->record("stop");
        if (log_->failStop)
            return Result<void>::err("stop without data");
        return Result<void>::ok();
    }

    void release() override {
        log_->record("release");
        if (surface_)
            surface_->close();
    }

    SurfaceHandle inputSurface() const override {
        return surface_;
    }

private:
    std::shared_ptr<FakeBackendLog> log_;
    SurfaceHandle surface_;
};

inline EncoderBackendFactory fakeFactory(std::shared_ptr<FakeBackendLog> log) {
    return [log]() -> std::unique_ptr<EncoderBackend> {
        return std::make_unique<FakeEncoderBackend>(log);
    };
}

} // namespace evc::test
