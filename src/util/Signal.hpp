#pragma once
// Signal.hpp - Lightweight callback signal
// Plain C++ observers for code that is not a QObject

#include <algorithm>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>
#include "Types.hpp"

namespace evc {

template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = u64;

    SlotId connect(Slot slot) {
        std::lock_guard lock(mutex_);
        SlotId id = nextId_++;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) {
        std::lock_guard lock(mutex_);
        std::erase_if(slots_,
                      [id](const auto& entry) { return entry.first == id; });
    }

    // Slots run on the emitting thread, outside the lock so they may
    // connect or disconnect.
    void emitSignal(Args... args) {
        std::vector<std::pair<SlotId, Slot>> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot = slots_;
        }
        for (auto& [id, slot] : snapshot) {
            if (slot)
                slot(args...);
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<SlotId, Slot>> slots_;
    SlotId nextId_{1};
};

} // namespace evc
