#include "SerialContext.hpp"
#include "Logger.hpp"

namespace evc {

SerialContext::SerialContext(QThread* thread)
    : thread_(thread), anchor_(std::make_unique<QObject>()) {
    if (anchor_->thread() != thread_)
        anchor_->moveToThread(thread_);
}

SerialContext::~SerialContext() {
    if (thread_->isRunning() && !isCurrentThread())
        anchor_.release()->deleteLater();
}

bool SerialContext::isCurrentThread() const {
    return QThread::currentThread() == thread_;
}

void SerialContext::post(std::function<void()> task) {
    QMetaObject::invokeMethod(
            anchor_.get(),
            [task = std::move(task)] { task(); },
            Qt::QueuedConnection);
}

void SerialContext::invoke(const std::function<void()>& task) {
    if (isCurrentThread()) {
        task();
        return;
    }
    if (!thread_->isRunning()) {
        // Nothing else can run there, so inline is still serialized
        LOG_DEBUG("SerialContext: control thread not running, invoking inline");
        task();
        return;
    }
    QMetaObject::invokeMethod(
            anchor_.get(), [&task] { task(); }, Qt::BlockingQueuedConnection);
}

} // namespace evc
