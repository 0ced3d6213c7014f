#pragma once
#include <any>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trade {

// Topics published by the simulated broker; data is a trade::Order.
inline constexpr const char* kOrderPlacedTopic = "OrderPlaced";
inline constexpr const char* kOrderFilledTopic = "OrderFilled";

struct Event {
    std::string type;
    std::any data;
};

/*
Topic-keyed publish/subscribe.
Handlers run synchronously on the publishing thread, outside the bus lock and
against the handler list as it was when publish() started, so a handler may
subscribe, unsubscribe or publish again without deadlocking.
*/
class EventBus {
public:
    using Handler   = std::function<void(const Event&)>;
    using HandlerId = std::uint64_t;

    // Returns an id you can use to unsubscribe.
    HandlerId subscribe(const std::string& topic, Handler handler);

    // Returns true if a handler was removed.
    bool unsubscribe(const std::string& topic, HandlerId id);

    // Returns the number of handlers that received the event.
    size_t publish(const Event& ev) const;
    size_t publish(const std::string& topic, std::any data) const;

    size_t handler_count(const std::string& topic) const;

private:
    using Subscribers = std::vector<std::pair<HandlerId, Handler>>;

    std::unordered_map<std::string, Subscribers> handlers_;
    HandlerId next_id_{1};
    mutable std::mutex mutex_;
};

} // namespace trade
