/**
 * @file event_bus.hpp
 * @brief Synchronous publish/subscribe channel between the executor and the CLI.
 */

#ifndef MEDIAPRESS_EVENT_BUS_HPP
#define MEDIAPRESS_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mediapress {

/**
 * @brief Routes event structs to the handlers registered for their type.
 *
 * Worker jobs publish per-file events; the CLI listens to drive the progress
 * bar and gather report rows. Handlers run on the publishing thread, one at
 * a time, so they may touch shared state without locking.
 */
class EventBus {
public:
    /**
     * @brief Registers @p handler for every future @p Event.
     * @tparam Event Event struct, e.g. FileProcessCompleteEvent.
     * @param handler Callable taking `const Event&`.
     */
    template <typename Event, typename Handler>
    void subscribe(Handler&& handler) {
        Route route = [fn = std::function<void(const Event&)>(std::forward<Handler>(handler))](const void* event) {
            fn(*static_cast<const Event*>(event));
        };
        std::lock_guard lock(mutex_);
        routes_[typeid(Event)].push_back(std::move(route));
    }

    /// Delivers @p event to the handlers of its type, in subscription order.
    template <typename Event>
    void publish(const Event& event) {
        std::lock_guard lock(mutex_);
        const auto found = routes_.find(typeid(Event));
        if (found == routes_.end()) {
            return;
        }
        for (const auto& route : found->second) {
            route(&event);
        }
    }

private:
    using Route = std::function<void(const void*)>;

    std::mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Route>> routes_;
};

} // namespace mediapress

#endif // MEDIAPRESS_EVENT_BUS_HPP
