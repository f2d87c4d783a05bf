//
// Created by Giuseppe Francione on 14/01/26.
//

/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe bus carrying run notifications.
 */

#ifndef WEBPRESS_EVENT_BUS_HPP
#define WEBPRESS_EVENT_BUS_HPP

#include <functional>
#include <unordered_map>
#include <typeindex>
#include <vector>
#include <mutex>

namespace webpress {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details The RunCoordinator publishes progress, status and summary
     * events without knowing who listens (CLI progress bar, report
     * collector, the Converter observer bridge).
     *
     * Handlers run synchronously on the publishing thread, which for a
     * conversion run is the background worker.
     */
    class EventBus {
    public:
        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g. ProgressEvent).
         * @param handler Function invoked with a const reference to each published event.
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
            auto it = subscribers_.find(std::type_index(typeid(Event)));
            if (it != subscribers_.end()) {
                for (auto& fn : it->second) {
                    fn(&event);
                }
            }
        }

        /**
         * @brief Drops every subscription.
         */
        void clear() {
            std::lock_guard lock(mtx_);
            subscribers_.clear();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::recursive_mutex mtx_;
    };

} // namespace webpress

#endif // WEBPRESS_EVENT_BUS_HPP
