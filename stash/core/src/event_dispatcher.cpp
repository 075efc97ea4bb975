#include <stash/core/event_dispatcher.hpp>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stash::core {

namespace detail {

struct HandlerTable {
    struct Handler {
        uint64_t id;
        std::function<void(const void*)> callback;
    };

    void remove(std::type_index type, uint64_t handler_id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = handlers.find(type);
        if (it == handlers.end()) return;

        auto& list = it->second;
        list.erase(
            std::remove_if(list.begin(), list.end(),
                [handler_id](const Handler& h) { return h.id == handler_id; }),
            list.end()
        );
    }

    mutable std::mutex mutex;
    std::unordered_map<std::type_index, std::vector<Handler>> handlers;
    std::atomic<uint64_t> next_id{1};
};

} // namespace detail

// ============================================================================
// ScopedConnection
// ============================================================================

ScopedConnection::ScopedConnection(ScopedConnection&& other) noexcept
    : m_table(std::move(other.m_table))
    , m_type(other.m_type)
    , m_handler_id(std::exchange(other.m_handler_id, 0)) {}

ScopedConnection& ScopedConnection::operator=(ScopedConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        m_table = std::move(other.m_table);
        m_type = other.m_type;
        m_handler_id = std::exchange(other.m_handler_id, 0);
    }
    return *this;
}

void ScopedConnection::disconnect() {
    if (m_handler_id == 0) return;

    if (auto table = m_table.lock()) {
        table->remove(m_type, m_handler_id);
    }
    m_table.reset();
    m_handler_id = 0;
}

bool ScopedConnection::connected() const {
    return m_handler_id != 0 && !m_table.expired();
}

void ScopedConnection::release() {
    m_table.reset();
    m_handler_id = 0;
}

// ============================================================================
// EventDispatcher
// ============================================================================

EventDispatcher::EventDispatcher()
    : m_table(std::make_shared<detail::HandlerTable>()) {}

EventDispatcher::~EventDispatcher() = default;

uint64_t EventDispatcher::add_handler(std::type_index type, ErasedCallback callback) {
    uint64_t handler_id = m_table->next_id++;

    std::lock_guard<std::mutex> lock(m_table->mutex);
    m_table->handlers[type].push_back({handler_id, std::move(callback)});
    return handler_id;
}

void EventDispatcher::dispatch_erased(std::type_index type, const void* event) {
    // Copy under the lock so handlers may subscribe/disconnect while running
    std::vector<detail::HandlerTable::Handler> handlers_copy;
    {
        std::lock_guard<std::mutex> lock(m_table->mutex);
        auto it = m_table->handlers.find(type);
        if (it == m_table->handlers.end()) return;
        handlers_copy = it->second;
    }

    for (const auto& handler : handlers_copy) {
        handler.callback(event);
    }
}

size_t EventDispatcher::handler_count(std::type_index type) const {
    std::lock_guard<std::mutex> lock(m_table->mutex);
    auto it = m_table->handlers.find(type);
    return it != m_table->handlers.end() ? it->second.size() : 0;
}

} // namespace stash::core
