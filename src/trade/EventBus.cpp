// EventBus.cpp

#include "trade/EventBus.hpp"
#include <algorithm>
#ifdef TRADE_DEBUG
    #include <iostream>
#endif

namespace trade {

EventBus::HandlerId EventBus::subscribe(const std::string& topic, Handler handler) {
    std::lock_guard<std::mutex> lk(mutex_);
    const HandlerId id = next_id_++;
    handlers_[topic].emplace_back(id, std::move(handler));
    return id;
}

bool EventBus::unsubscribe(const std::string& topic, HandlerId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = handlers_.find(topic);
    if (it == handlers_.end()) return false;

    auto& subs = it->second;
    auto sit = std::find_if(subs.begin(), subs.end(),
                            [id](const auto& entry) { return entry.first == id; });
    if (sit == subs.end()) return false;

    subs.erase(sit);
    if (subs.empty()) handlers_.erase(it);
    return true;
}

size_t EventBus::publish(const Event& ev) const {
    Subscribers snapshot;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = handlers_.find(ev.type);
        if (it == handlers_.end()) return 0;
        snapshot = it->second;
    }

    #ifdef TRADE_DEBUG
        std::cout << "[debug] [bus publish] " << ev.type << " -> " << snapshot.size() << " handler(s)\n";
    #endif

    for (const auto& [id, handler] : snapshot) {
        handler(ev);
    }
    return snapshot.size();
}

size_t EventBus::publish(const std::string& topic, std::any data) const {
    return publish(Event{topic, std::move(data)});
}

size_t EventBus::handler_count(const std::string& topic) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = handlers_.find(topic);
    return it == handlers_.end() ? 0 : it->second.size();
}

}
