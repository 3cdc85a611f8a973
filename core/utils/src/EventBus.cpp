#include "EventBus.h"
#include "Logger.h"

#include <algorithm>

namespace CubeLink {

    SubscriptionId EventBus::subscribe(const std::string& eventName,
                                       EventCallback callback,
                                       int priority,
                                       EventFilter filter) {
        SubscriptionId id = nextId_.fetch_add(1);

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& subsPtr = subscribers_[eventName];
        if (!subsPtr) {
            subsPtr = std::make_shared<std::vector<Subscription>>();
        }
        // Copy-on-write keeps in-flight publish() snapshots valid
        auto subsCopy = std::make_shared<std::vector<Subscription>>(*subsPtr);
        Subscription subscription{id, std::move(callback), priority, std::move(filter)};

        auto insertPos = subsCopy->begin();
        for (; insertPos != subsCopy->end(); ++insertPos) {
            if (priority > insertPos->priority) {
                break;
            }
        }
        subsCopy->insert(insertPos, std::move(subscription));
        subsPtr.swap(subsCopy);
        return id;
    }

    bool EventBus::unsubscribe(SubscriptionId id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto& [name, subsPtr] : subscribers_) {
            if (!subsPtr) {
                continue;
            }
            auto it = std::find_if(subsPtr->begin(), subsPtr->end(),
                                   [id](const Subscription& s) { return s.id == id; });
            if (it == subsPtr->end()) {
                continue;
            }
            auto subsCopy = std::make_shared<std::vector<Subscription>>(*subsPtr);
            subsCopy->erase(subsCopy->begin() + (it - subsPtr->begin()));
            subsPtr.swap(subsCopy);
            return true;
        }
        return false;
    }

    void EventBus::publish(const std::string& eventName, const std::any& data) {
        std::shared_ptr<std::vector<Subscription>> snapshot;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = subscribers_.find(eventName);
            if (it == subscribers_.end() || !it->second) {
                return;
            }
            snapshot = it->second;
        }

        // std::unordered_map never invalidates element references on insert
        Metrics* storedMetrics = nullptr;
        {
            std::lock_guard<std::mutex> metricsLock(metricsMutex_);
            storedMetrics = &metrics_[eventName];
        }

        for (const auto& sub : *snapshot) {
            storedMetrics->published.fetch_add(1, std::memory_order_relaxed);
            if (sub.filter && !sub.filter(data)) {
                storedMetrics->filtered.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            try {
                sub.callback(data);
            } catch (const std::exception& e) {
                storedMetrics->failed.fetch_add(1, std::memory_order_relaxed);
                Logger::instance().warn("Subscriber for " + eventName + " threw: " + e.what(), "EventBus");
            }
        }
    }

    std::optional<EventBus::Metrics> EventBus::getMetrics(const std::string& eventName) const {
        std::lock_guard<std::mutex> lock(metricsMutex_);
        auto it = metrics_.find(eventName);
        if (it == metrics_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

}
