#pragma once

/// @file synchronized_engine.hpp
/// Engine wrapper serializing every operation behind one mutex.
///
/// The lock covers the whole of apply_move, so legality checks and the
/// mutation they guard are atomic with respect to other callers.

#include <chessref/engine.hpp>

#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace chessref {

class SynchronizedEngine {
   public:
    SynchronizedEngine() = default;
    explicit SynchronizedEngine(Engine engine) : engine_(std::move(engine)) {}

    SynchronizedEngine(const SynchronizedEngine&) = delete;
    SynchronizedEngine& operator=(const SynchronizedEngine&) = delete;

    [[nodiscard]] Result<MoveRecord> apply_move(
        std::string_view from, std::string_view to,
        std::optional<std::string_view> promotion = std::nullopt) {
        std::lock_guard lock(mutex_);
        return engine_.apply_move(from, to, promotion);
    }

    void restart() {
        std::lock_guard lock(mutex_);
        engine_.restart();
    }

    /// Restart and return the fresh state, both under one lock.
    [[nodiscard]] GameSnapshot restart_and_state() {
        std::lock_guard lock(mutex_);
        engine_.restart();
        return engine_.state();
    }

    [[nodiscard]] GameSnapshot state() const {
        std::lock_guard lock(mutex_);
        return engine_.state();
    }

    /// Copy of the move log.
    [[nodiscard]] std::vector<MoveRecord> history() const {
        std::lock_guard lock(mutex_);
        return engine_.history();
    }

   private:
    mutable std::mutex mutex_;
    Engine engine_;
};

}  // namespace chessref
