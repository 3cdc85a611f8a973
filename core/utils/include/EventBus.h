#pragma once
#include <string>
#include <functional>
#include <vector>
#include <unordered_map>
#include <any>
#include <utility>
#include <mutex>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <atomic>
#include <cstdint>

namespace CubeLink {

    using EventCallback = std::function<void(const std::any&)>;
    using EventFilter = std::function<bool(const std::any&)>;
    using SubscriptionId = uint64_t;

    /**
     * @brief In-process publish/subscribe hub.
     *
     * Subscribers run synchronously on the publishing thread, highest
     * priority first. publish() works on a snapshot of the subscriber list,
     * so a callback may subscribe, unsubscribe or publish re-entrantly.
     */
    class EventBus {
    public:
        struct Subscription {
            SubscriptionId id;
            EventCallback callback;
            int priority;
            EventFilter filter;
        };

        struct Metrics {
            std::atomic<size_t> published{0};
            std::atomic<size_t> filtered{0};
            std::atomic<size_t> failed{0};

            Metrics() = default;
            Metrics(const Metrics& other)
                : published(other.published.load())
                , filtered(other.filtered.load())
                , failed(other.failed.load()) {}
            Metrics& operator=(const Metrics& other) {
                published = other.published.load();
                filtered = other.filtered.load();
                failed = other.failed.load();
                return *this;
            }
        };

        /**
         * @brief Subscribe to an event.
         * @param eventName The name of the event.
         * @param callback Invoked for every accepted publication.
         * @param priority Higher values run first.
         * @param filter Optional predicate; publications it rejects are skipped.
         * @return Id usable with unsubscribe().
         */
        SubscriptionId subscribe(const std::string& eventName,
                                 EventCallback callback,
                                 int priority = 0,
                                 EventFilter filter = nullptr);

        bool unsubscribe(SubscriptionId id);

        void publish(const std::string& eventName, const std::any& data);

        std::optional<Metrics> getMetrics(const std::string& eventName) const;

    private:
        std::unordered_map<std::string, std::shared_ptr<std::vector<Subscription>>> subscribers_;
        mutable std::shared_mutex mutex_;
        mutable std::mutex metricsMutex_;
        std::unordered_map<std::string, Metrics> metrics_;
        std::atomic<SubscriptionId> nextId_{1};
    };

}
