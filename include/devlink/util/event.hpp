#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>
#include <mutex>

namespace devlink {
    namespace util {

        // ─── Listener token for unsubscription ────────────────────────────────────────
        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Type-safe event dispatcher ──────────────────────────────────────────────
        // Listeners may be added or removed from any thread, including from inside
        // a listener. emit() invokes a snapshot taken under the lock, so a listener
        // removed during dispatch can still see the in-flight emission.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = 0;
                std::function<void(Args...)> fn;
            };

            mutable std::mutex mutex_;
            dp::Vector<Listener> listeners_;
            ListenerToken next_token_ = 1;

          public:
            ListenerToken subscribe(std::function<void(Args...)> fn) {
                std::lock_guard<std::mutex> lock(mutex_);
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn)});
                return token;
            }

            bool unsubscribe(ListenerToken token) {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
                    if (it->token == token) {
                        listeners_.erase(it);
                        return true;
                    }
                }
                return false;
            }

            void emit(Args... args) {
                dp::Vector<Listener> snapshot;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    snapshot = listeners_;
                }
                for (auto &listener : snapshot) {
                    if (listener.fn) {
                        listener.fn(args...);
                    }
                }
            }

            usize count() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return listeners_.size();
            }

            void clear() {
                std::lock_guard<std::mutex> lock(mutex_);
                listeners_.clear();
            }

            ListenerToken operator+=(std::function<void(Args...)> fn) { return subscribe(std::move(fn)); }
        };

    } // namespace util
    using namespace util;
} // namespace devlink
