/**
 * @file Application.hpp
 * @brief CLI application shell.
 *
 * This file defines the Application class which owns the Qt event loop,
 * the recorder control thread and the multi-camera session. main() parses
 * arguments, calls init() and runs exec().
 *
 * @section Dependencies
 * - Qt Core (QCoreApplication, QCommandLineParser, QThread)
 * - Config, Logger
 * - MultiCameraRecorder, TestPatternCapture
 */

#pragma once
#include <QCoreApplication>
#include <QThread>
#include <QTimer>
#include <csignal>
#include <memory>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace evc {

class SerialContext;
class TestPatternCapture;
class MultiCameraRecorder;

struct AppOptions {
    fs::path configPath;
    fs::path outputDirectory;
    u32 durationSec{0}; // 0 = until interrupted
    u32 segmentSec{0};  // 0 = from config
    bool debug{false};
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    Result<AppOptions> parseArgs();
    Result<void> init(const AppOptions& opts);
    int exec();

    // Async-signal-safe
    static void requestStop();

private:
    void shutdown();

    QCoreApplication app_;
    QThread controlThread_;
    QTimer stopPoll_;

    std::unique_ptr<SerialContext> context_;
    std::unique_ptr<TestPatternCapture> capture_;
    std::unique_ptr<MultiCameraRecorder> recorder_;

    u32 durationSec_{0};
    u32 width_{0};
    u32 height_{0};
    bool shuttingDown_{false};

    static volatile std::sig_atomic_t stopRequested_;
};

} // namespace evc
