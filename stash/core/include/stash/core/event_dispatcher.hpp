#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <typeindex>

namespace stash::core {

namespace detail {
struct HandlerTable;
}

// ============================================================================
// ScopedConnection - RAII handle for event subscriptions
// ============================================================================
//
// Holds a weak reference to the dispatcher's handler table. Destroying the
// dispatcher first is fine: the connection then reports disconnected and its
// destructor does nothing.

class ScopedConnection {
public:
    ScopedConnection() = default;
    ~ScopedConnection() { disconnect(); }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ScopedConnection(ScopedConnection&& other) noexcept;
    ScopedConnection& operator=(ScopedConnection&& other) noexcept;

    void disconnect();
    bool connected() const;

    // Keep the handler registered for the dispatcher's lifetime
    void release();

private:
    friend class EventDispatcher;

    ScopedConnection(std::weak_ptr<detail::HandlerTable> table, std::type_index type, uint64_t handler_id)
        : m_table(std::move(table)), m_type(type), m_handler_id(handler_id) {}

    std::weak_ptr<detail::HandlerTable> m_table;
    std::type_index m_type{typeid(void)};
    uint64_t m_handler_id = 0;
};

// ============================================================================
// EventDispatcher - Type-safe synchronous event pub/sub
// ============================================================================
//
// Handlers run on the dispatching thread, in subscription order. A handler
// may subscribe or disconnect while an event is being dispatched; the change
// applies from the next dispatch.

class EventDispatcher {
public:
    EventDispatcher();
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;
    EventDispatcher(EventDispatcher&&) = delete;
    EventDispatcher& operator=(EventDispatcher&&) = delete;

    template<typename T>
    [[nodiscard]] ScopedConnection subscribe(std::function<void(const T&)> callback) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");

        auto type_idx = std::type_index(typeid(T));
        uint64_t handler_id = add_handler(type_idx,
            [callback = std::move(callback)](const void* event) {
                callback(*static_cast<const T*>(event));
            });

        return ScopedConnection(m_table, type_idx, handler_id);
    }

    template<typename T>
    void dispatch(const T& event) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");
        dispatch_erased(std::type_index(typeid(T)), &event);
    }

    template<typename T>
    size_t handler_count() const {
        return handler_count(std::type_index(typeid(T)));
    }

private:
    using ErasedCallback = std::function<void(const void*)>;

    uint64_t add_handler(std::type_index type, ErasedCallback callback);
    void dispatch_erased(std::type_index type, const void* event);
    size_t handler_count(std::type_index type) const;

    std::shared_ptr<detail::HandlerTable> m_table;
};

} // namespace stash::core
