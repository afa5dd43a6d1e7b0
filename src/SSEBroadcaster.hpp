#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>

// Fans server-sent events out to the connected event streams.
class SSEBroadcaster {
public:
    // Returns false once the client is gone.
    using Sender = std::function<bool(const std::string&)>;

    size_t subscribe(Sender sendEvent);
    void unsubscribe(size_t id);
    // Sends one event to every client and drops those that fail; returns how many received it.
    size_t broadcast(const std::string& type, const std::string& data);
    size_t clientCount() const;

    static std::string formatEvent(const std::string& type, const std::string& data);

private:
    std::map<size_t, Sender> clients;
    size_t nextId = 1;
    mutable std::mutex mtx;
};
