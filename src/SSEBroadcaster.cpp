#include "SSEBroadcaster.hpp"

size_t SSEBroadcaster::subscribe(Sender sendEvent) {
    std::lock_guard lock(mtx);
    size_t id = nextId++;
    clients.emplace(id, std::move(sendEvent));
    return id;
}

void SSEBroadcaster::unsubscribe(size_t id) {
    std::lock_guard lock(mtx);
    clients.erase(id);
}

std::string SSEBroadcaster::formatEvent(const std::string& type, const std::string& data) {
    std::string event = "event: " + type + "\n";
    // every line of a multi-line payload needs its own data: field
    size_t start = 0;
    while (true) {
        size_t newline = data.find('\n', start);
        event += "data: " + data.substr(start, newline == std::string::npos ? std::string::npos : newline - start) + "\n";
        if (newline == std::string::npos) break;
        start = newline + 1;
    }
    return event + "\n";
}

size_t SSEBroadcaster::broadcast(const std::string& type, const std::string& data) {
    std::lock_guard lock(mtx);
    std::string event = formatEvent(type, data);
    size_t delivered = 0;
    for (auto it = clients.begin(); it != clients.end();) {
        if (it->second(event)) {
            ++delivered;
            ++it;
        } else {
            it = clients.erase(it);
        }
    }
    return delivered;
}

size_t SSEBroadcaster::clientCount() const {
    std::lock_guard lock(mtx);
    return clients.size();
}
