#include "RotationTimer.hpp"
#include "core/Logger.hpp"

namespace evc {

RotationTimer::RotationTimer(SerialContext& context, Duration delay)
    : context_(context), delay_(delay), timer_(std::make_unique<QTimer>()) {
    timer_->setSingleShot(true);
    timer_->setTimerType(Qt::PreciseTimer);
    if (timer_->thread() != context_.thread())
        timer_->moveToThread(context_.thread());
}

RotationTimer::~RotationTimer() {
    context_.invoke([this] {
        cancel();
        timer_.reset();
    });
}

void RotationTimer::schedule(Callback callback) {
    cancel();

    callback_ = std::move(callback);
    armed_ = true;
    u64 generation = ++generation_;

    connection_ = QObject::connect(
            timer_.get(), &QTimer::timeout, context_.anchor(), [this, generation] {
                onTimeout(generation);
            });
    timer_->start(delay_);
}

void RotationTimer::cancel() {
    ++generation_;
    armed_ = false;
    callback_ = nullptr;
    if (timer_) {
        timer_->stop();
        QObject::disconnect(connection_);
    }
}

void RotationTimer::onTimeout(u64 generation) {
    if (!armed_ || generation != generation_) {
        LOG_TRACE("RotationTimer: stale timeout ignored");
        return;
    }

    armed_ = false;
    QObject::disconnect(connection_);
    auto callback = std::move(callback_);
    callback_ = nullptr;
    if (callback)
        callback();
}

} // namespace evc
