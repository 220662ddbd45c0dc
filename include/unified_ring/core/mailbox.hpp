/// @file mailbox.hpp
/// @brief Hand-off of widget updates from worker threads to the UI thread.
///
/// All ring state is owned by one thread. Other threads post messages into a
/// mailbox; the owner drains it once per frame and applies the messages in
/// arrival order.
///
/// Usage:
/// @code
///   unified_ring::execution_context ui;       // constructed on the UI thread
///   unified_ring::mailbox<int> updates;
///
///   // worker thread:
///   updates.post(42);
///
///   // UI thread, once per frame:
///   updates.drain([&](int v) { ring.set_progress(v); });
/// @endcode
#pragma once

#include <concepts>
#include <cstddef>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace unified_ring {

    /// @brief Identifies the thread that owns a widget's state.
    class execution_context {
    public:
        execution_context() noexcept : owner_(std::this_thread::get_id()) {}

        /// @brief True when called from the owning thread.
        [[nodiscard]] bool is_current() const noexcept { return std::this_thread::get_id() == owner_; }

        /// @brief Make the calling thread the owner (e.g. after moving a widget to a new UI thread).
        void rebind() noexcept { owner_ = std::this_thread::get_id(); }

        [[nodiscard]] std::thread::id owner() const noexcept { return owner_; }

    private:
        std::thread::id owner_;
    };

    /**
     * @brief Mutex-protected FIFO of pending messages.
     * @tparam Message Any movable message type.
     */
    template<std::movable Message>
    class mailbox {
    public:
        /// @brief Queue a message. Safe from any thread.
        void post(Message msg) {
            const std::scoped_lock lock(mutex_);
            pending_.push_back(std::move(msg));
        }

        /**
         * @brief Apply every pending message in arrival order.
         *
         * The queue is swapped out under the lock and applied outside it, so
         * @p fn may post again without deadlocking; such messages wait for the
         * next drain.
         * @return Number of messages applied.
         */
        template<typename Fn>
            requires std::invocable<Fn &, Message &&>
        std::size_t drain(Fn &&fn) {
            std::vector<Message> batch;
            {
                const std::scoped_lock lock(mutex_);
                batch.swap(pending_);
            }
            for (auto &msg: batch) fn(std::move(msg));
            return batch.size();
        }

        void clear() {
            const std::scoped_lock lock(mutex_);
            pending_.clear();
        }

        [[nodiscard]] std::size_t size() const {
            const std::scoped_lock lock(mutex_);
            return pending_.size();
        }

        [[nodiscard]] bool empty() const { return size() == 0; }

    private:
        mutable std::mutex   mutex_;
        std::vector<Message> pending_;
    };

} // namespace unified_ring
