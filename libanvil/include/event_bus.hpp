/**
 * @file event_bus.hpp
 * @brief Thread-safe publish/subscribe bus carrying optimizer progress.
 */

#ifndef ANVIL_EVENT_BUS_HPP
#define ANVIL_EVENT_BUS_HPP

#include <functional>
#include <unordered_map>
#include <typeindex>
#include <vector>
#include <mutex>

namespace anvil {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details The optimizer and its stages publish events (progress,
     * candidate outcomes, the final result) without knowing who listens.
     * The CLI progress bar, the report writer and the facade observer
     * subscribe to the event types they care about.
     *
     * A bus is passed explicitly to every stage that reports progress;
     * there is no process-wide instance. Handlers may be invoked from
     * worker threads and must not publish on the same bus.
     */
    class EventBus {
    public:
        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g. ProgressEvent).
         * @param handler Invoked with a const reference to each published event.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         * @tparam Event The event struct type.
         * @param event The event instance to publish.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it != subscribers_.end()) {
                for (auto& fn : it->second) {
                    fn(&event);
                }
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_; ///< event type -> handlers
        std::mutex mtx_;                                                          ///< protects subscribers_
    };

    /**
     * @brief Publish through an optional bus.
     *
     * Stages receive `EventBus*` and may run without one (tests, plain
     * library calls); this keeps the null check in one place.
     */
    template <typename Event>
    void publish_if(EventBus* bus, const Event& event) {
        if (bus) {
            bus->publish(event);
        }
    }

} // namespace anvil

#endif // ANVIL_EVENT_BUS_HPP
