#include "Application.hpp"
#include <QCommandLineParser>
#include <chrono>
#include "Config.hpp"
#include "Logger.hpp"
#include "SerialContext.hpp"
#include "capture/TestPatternCapture.hpp"
#include "recorder/EncoderSettings.hpp"
#include "recorder/FFmpegEncoderBackend.hpp"
#include "session/MultiCameraRecorder.hpp"
#include "util/FileUtils.hpp"

namespace evc {

volatile std::sig_atomic_t Application::stopRequested_ = 0;

Application::Application(int& argc, char** argv) : app_(argc, argv) {
    QCoreApplication::setApplicationName("evcam-recorder");
    QCoreApplication::setApplicationVersion("0.1.0");
    controlThread_.setObjectName("recorder-control");
}

Application::~Application() {
    // Controllers tear down on the control thread, so it must outlive them
    recorder_.reset();
    capture_.reset();
    controlThread_.quit();
    controlThread_.wait();
    context_.reset();
    Logger::shutdown();
}

Result<AppOptions> Application::parseArgs() {
    QCommandLineParser parser;
    parser.setApplicationDescription(
            "Multi-camera rolling segment recorder");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOpt({"c", "config"},
                                 "Configuration file (TOML).",
                                 "file");
    QCommandLineOption outputOpt({"o", "output"},
                                 "Directory for segment files.",
                                 "dir");
    QCommandLineOption durationOpt(
            {"d", "duration"},
            "Stop after this many seconds (0 = until interrupted).",
            "seconds",
            "0");
    QCommandLineOption segmentOpt({"s", "segment"},
                                  "Segment length in seconds.",
                                  "seconds");
    QCommandLineOption debugOpt("debug", "Enable debug logging.");

    parser.addOptions(
            {configOpt, outputOpt, durationOpt, segmentOpt, debugOpt});
    parser.process(app_);

    AppOptions opts;
    opts.debug = parser.isSet(debugOpt);

    if (parser.isSet(configOpt))
        opts.configPath = parser.value(configOpt).toStdString();
    if (parser.isSet(outputOpt))
        opts.outputDirectory =
                file::expandHome(parser.value(outputOpt).toStdString());

    bool ok = false;
    opts.durationSec = parser.value(durationOpt).toUInt(&ok);
    if (!ok)
        return Result<AppOptions>::err("Invalid --duration: " +
                                       parser.value(durationOpt).toStdString());

    if (parser.isSet(segmentOpt)) {
        opts.segmentSec = parser.value(segmentOpt).toUInt(&ok);
        if (!ok || opts.segmentSec == 0)
            return Result<AppOptions>::err(
                    "Invalid --segment: " +
                    parser.value(segmentOpt).toStdString());
    }

    return Result<AppOptions>::ok(std::move(opts));
}

Result<void> Application::init(const AppOptions& opts) {
    Logger::init("evcam-recorder", opts.debug);

    auto loaded = opts.configPath.empty() ? CONFIG.loadDefault()
                                          : CONFIG.load(opts.configPath);
    if (!loaded)
        return loaded;

    if (CONFIG.debug() && !opts.debug)
        Logger::init("evcam-recorder", true);

    auto& rec = CONFIG.recording();
    if (!opts.outputDirectory.empty())
        rec.outputDirectory = opts.outputDirectory;
    if (opts.segmentSec > 0)
        rec.segmentDurationMs = opts.segmentSec * 1000;

    auto cameras = CONFIG.enabledCameras();
    if (cameras.empty())
        return Result<void>::err("No enabled cameras in configuration");

    auto settings = EncoderSettings::fromConfig();
    if (auto res = file::ensureDir(rec.outputDirectory); !res)
        return res;

    durationSec_ = opts.durationSec;
    width_ = rec.video.width;
    height_ = rec.video.height;

    controlThread_.start();
    context_ = std::make_unique<SerialContext>(&controlThread_);
    capture_ = std::make_unique<TestPatternCapture>(rec.video.fps);
    recorder_ = std::make_unique<MultiCameraRecorder>(
            std::move(cameras),
            rec.outputDirectory,
            FFmpegEncoderBackend::factory(std::move(settings)),
            *context_,
            *capture_,
            Duration(rec.segmentDurationMs));

    recorder_->recordingError.connect(
            [](const std::string& id, const std::string& msg) {
                LOG_WARN("Camera {} reported: {}", id, msg);
            });

    LOG_INFO("Recording {}x{} @ {} fps, {} ms segments into {}",
             width_,
             height_,
             rec.video.fps,
             rec.segmentDurationMs,
             rec.outputDirectory.string());
    return Result<void>::ok();
}

int Application::exec() {
    if (!recorder_)
        return 1;

    if (recorder_->startAll(width_, height_) == 0) {
        LOG_ERROR("No camera could be started");
        return 1;
    }

    QObject::connect(&stopPoll_, &QTimer::timeout, [this] {
        if (stopRequested_)
            shutdown();
    });
    stopPoll_.start(200);

    if (durationSec_ > 0) {
        QTimer::singleShot(std::chrono::seconds(durationSec_), &app_, [this] {
            LOG_INFO("Requested duration reached");
            shutdown();
        });
    }

    int rc = QCoreApplication::exec();
    recorder_->releaseAll();
    return rc;
}

void Application::requestStop() {
    stopRequested_ = 1;
}

void Application::shutdown() {
    if (shuttingDown_)
        return;
    shuttingDown_ = true;
    stopPoll_.stop();

    LOG_INFO("Stopping all cameras");
    recorder_->stopAll();

    // Let the queued stop events reach the session before leaving
    QTimer::singleShot(0, &app_, &QCoreApplication::quit);
}

} // namespace evc
