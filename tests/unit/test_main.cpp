/**
 * @file test_main.cpp
 * @brief Test suite entry point using Qt Test.
 */
#include <QCoreApplication>
#include <QtTest>

// Each test class lives in its own translation unit
int runTestLogger(int argc, char** argv);
int runTestConfig(int argc, char** argv);
int runTestConfigParsers(int argc, char** argv);
int runTestSerialContext(int argc, char** argv);
int runTestInputSurface(int argc, char** argv);
int runTestSegmentNamer(int argc, char** argv);
int runTestRotationTimer(int argc, char** argv);
int runTestSegmentedRecordingController(int argc, char** argv);
int runTestFFmpegEncoderBackend(int argc, char** argv);
int runTestMultiCameraRecorder(int argc, char** argv);
int runTestTestPatternCapture(int argc, char** argv);

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    int status = 0;

    status |= runTestLogger(argc, argv);
    status |= runTestConfig(argc, argv);
    status |= runTestConfigParsers(argc, argv);
    status |= runTestSerialContext(argc, argv);
    status |= runTestInputSurface(argc, argv);
    status |= runTestSegmentNamer(argc, argv);
    status |= runTestRotationTimer(argc, argv);
    status |= runTestSegmentedRecordingController(argc, argv);
    status |= runTestFFmpegEncoderBackend(argc, argv);
    status |= runTestMultiCameraRecorder(argc, argv);
    status |= runTestTestPatternCapture(argc, argv);

    return status;
}
