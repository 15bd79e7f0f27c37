/**
 * @file RotationTimer.hpp
 * @brief Cancellable single-shot delay that ends a segment.
 *
 * The timer lives on the recorder's SerialContext and its callback runs
 * there, so it can never overlap a prepare/start/stop call. Every
 * schedule() bumps a generation counter and a fire only runs the callback
 * of the generation that is still armed, which makes cancel() final even
 * if a timeout was already on its way.
 *
 * Must be scheduled, cancelled and destroyed on the context thread.
 */

#pragma once
#include <QTimer>
#include <functional>
#include <memory>
#include "core/SerialContext.hpp"
#include "util/Types.hpp"

namespace evc {

class RotationTimer {
public:
    using Callback = std::function<void()>;

    RotationTimer(SerialContext& context, Duration delay);
    ~RotationTimer();

    RotationTimer(const RotationTimer&) = delete;
    RotationTimer& operator=(const RotationTimer&) = delete;

    // Replaces any pending schedule
    void schedule(Callback callback);
    void cancel();

    bool isPending() const {
        return armed_;
    }
    Duration delay() const {
        return delay_;
    }

private:
    void onTimeout(u64 generation);

    SerialContext& context_;
    Duration delay_;
    std::unique_ptr<QTimer> timer_;
    QMetaObject::Connection connection_;
    Callback callback_;
    u64 generation_{0};
    bool armed_{false};
};

} // namespace evc
