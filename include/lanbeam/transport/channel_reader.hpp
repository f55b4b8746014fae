/**
 * @file channel_reader.hpp
 * @brief Restartable single-consumer pull view over a push-only transport
 *
 * WHY THIS FILE EXISTS:
 * Data channels push inbound messages from their own thread. The handshake
 * and the transfer protocol want to read them as plain sequential code:
 * "read until the delimiter", hand over, "read the next header". The reader
 * buffers everything until pulled, and lets consumers come and go without
 * losing items.
 *
 * EXAMPLE:
 * AsyncChannelReader<int> reader;
 * reader.append(1); reader.append(2); reader.append(3);
 * {
 *     auto handle = reader.consume();
 *     while (auto v = handle.next()) { if (*v == 2) break; }
 * }                                   // released, 3 is still buffered
 * auto rest = reader.read_next();     // 3
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace lanbeam::transport {

template<typename T>
class AsyncChannelReader {
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<T> items;
        bool closed = false;
        bool handle_active = false;
    };

public:
    /**
     * @brief Cursor over the reader; at most one may be active at a time
     *
     * Releasing (explicitly or by destruction) keeps unconsumed items buffered.
     */
    class Handle {
    public:
        Handle(Handle&& other) noexcept : state_(std::move(other.state_)) {}

        Handle& operator=(Handle&& other) noexcept {
            if (this != &other) {
                release();
                state_ = std::move(other.state_);
            }
            return *this;
        }

        Handle(const Handle&) = delete;
        Handle& operator=(const Handle&) = delete;

        ~Handle() { release(); }

        /**
         * @brief Next item in arrival order
         *
         * BLOCKS: until an item arrives or the reader is closed
         * RETURNS: nullopt once closed and drained, or if this handle was released
         */
        std::optional<T> next() {
            if (!state_) {
                return std::nullopt;
            }
            std::unique_lock lock(state_->mutex);
            state_->cv.wait(lock, [this]() {
                return !state_->items.empty() || state_->closed;
            });
            return pop_locked();
        }

        /**
         * @brief Like next(), but gives up after `timeout` (returns nullopt)
         */
        template<typename Rep, typename Period>
        std::optional<T> next_for(const std::chrono::duration<Rep, Period>& timeout) {
            if (!state_) {
                return std::nullopt;
            }
            std::unique_lock lock(state_->mutex);
            if (!state_->cv.wait_for(lock, timeout, [this]() {
                    return !state_->items.empty() || state_->closed;
                })) {
                return std::nullopt;
            }
            return pop_locked();
        }

        void release() {
            if (!state_) {
                return;
            }
            {
                std::lock_guard lock(state_->mutex);
                state_->handle_active = false;
            }
            state_.reset();
        }

        [[nodiscard]] bool active() const noexcept { return state_ != nullptr; }

    private:
        friend class AsyncChannelReader;

        explicit Handle(std::shared_ptr<State> state) : state_(std::move(state)) {}

        std::optional<T> pop_locked() {
            if (state_->items.empty()) {
                return std::nullopt;
            }
            T item = std::move(state_->items.front());
            state_->items.pop_front();
            return item;
        }

        std::shared_ptr<State> state_;
    };

    AsyncChannelReader() : state_(std::make_shared<State>()) {}

    AsyncChannelReader(const AsyncChannelReader&) = delete;
    AsyncChannelReader& operator=(const AsyncChannelReader&) = delete;

    /**
     * @brief Buffer one inbound item
     *
     * BLOCKS: No. Items appended after close() are dropped.
     */
    void append(T item) {
        {
            std::lock_guard lock(state_->mutex);
            if (state_->closed) {
                return;
            }
            state_->items.push_back(std::move(item));
        }
        state_->cv.notify_all();
    }

    /**
     * @brief Open the single consumer cursor
     *
     * THROWS: std::logic_error if another handle has not been released
     */
    Handle consume() {
        std::lock_guard lock(state_->mutex);
        if (state_->handle_active) {
            throw std::logic_error("AsyncChannelReader: a consumer handle is already active");
        }
        state_->handle_active = true;
        return Handle(state_);
    }

    /**
     * @brief consume() exactly one item, then release
     */
    std::optional<T> read_next() {
        auto handle = consume();
        return handle.next();
    }

    template<typename Rep, typename Period>
    std::optional<T> read_next_for(const std::chrono::duration<Rep, Period>& timeout) {
        auto handle = consume();
        return handle.next_for(timeout);
    }

    /**
     * @brief Transport went away: wake every waiter, keep buffered items for draining
     */
    void close() {
        {
            std::lock_guard lock(state_->mutex);
            state_->closed = true;
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(state_->mutex);
        return state_->closed;
    }

    [[nodiscard]] std::size_t buffered() const {
        std::lock_guard lock(state_->mutex);
        return state_->items.size();
    }

private:
    std::shared_ptr<State> state_;
};

} // namespace lanbeam::transport
