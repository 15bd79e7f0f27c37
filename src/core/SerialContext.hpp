/**
 * @file SerialContext.hpp
 * @brief Single-threaded execution context for recorder control.
 *
 * All state transitions of a recorder run on one QThread. SerialContext is
 * the explicit handle to that thread: tasks posted to it run one at a time
 * in FIFO order, and invoke() lets a caller on another thread run a task
 * there and wait for it. A context bound to the calling thread simply runs
 * invoke() inline.
 *
 * @section Dependencies
 * - Qt Core (QThread, QMetaObject::invokeMethod)
 *
 * @section Patterns
 * - Active Object: callers never touch recorder state from their own thread.
 */

#pragma once
#include <QObject>
#include <QThread>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>

namespace evc {

class SerialContext {
public:
    explicit SerialContext(QThread* thread = QThread::currentThread());
    ~SerialContext();

    SerialContext(const SerialContext&) = delete;
    SerialContext& operator=(const SerialContext&) = delete;

    QThread* thread() const {
        return thread_;
    }

    // Lives on thread(); use as receiver for timers and queued calls
    QObject* anchor() const {
        return anchor_.get();
    }

    bool isCurrentThread() const;

    void post(std::function<void()> task);
    void invoke(const std::function<void()>& task);

    template <typename Fn>
    auto call(Fn&& fn) -> std::invoke_result_t<Fn> {
        using R = std::invoke_result_t<Fn>;
        if constexpr (std::is_void_v<R>) {
            invoke(std::forward<Fn>(fn));
        } else {
            std::optional<R> out;
            invoke([&out, &fn] { out.emplace(fn()); });
            return std::move(*out);
        }
    }

private:
    QThread* thread_;
    std::unique_ptr<QObject> anchor_;
};

} // namespace evc
