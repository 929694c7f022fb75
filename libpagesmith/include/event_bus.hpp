/**
 * @file event_bus.hpp
 * @brief Simple, thread-safe publish/subscribe event bus.
 */

#ifndef PAGESMITH_EVENT_BUS_HPP
#define PAGESMITH_EVENT_BUS_HPP

#include <functional>
#include <unordered_map>
#include <typeindex>
#include <vector>
#include <mutex>

namespace pagesmith {

    /**
     * @brief Type-safe publish/subscribe event bus.
     *
     * @details The exporter publishes progress and lifecycle events without
     * knowing who listens (CLI progress bar, public API observer, tests).
     * Subscriptions and publications are serialized by one mutex, so
     * handlers run one at a time even when pages finish concurrently.
     */
    class EventBus {
    public:
        EventBus() = default;

        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it != subscribers_.end()) {
                for (auto& fn : it->second) {
                    fn(&event);
                }
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace pagesmith

#endif // PAGESMITH_EVENT_BUS_HPP
