#pragma once

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace lidarsim
{

/// Observer list. Slots fire synchronously in subscription order.
template <typename... Args>
class Signal
{
public:
    using Slot = std::function<void(Args...)>;
    using ConnectionId = std::size_t;

    ConnectionId connect(Slot slot)
    {
        const ConnectionId id = m_nextId++;
        m_slots.emplace_back(id, std::move(slot));
        return id;
    }

    void disconnect(ConnectionId id)
    {
        std::erase_if(m_slots, [id](const auto& entry) { return entry.first == id; });
    }

    void emit(Args... args) const
    {
        // Slots may connect or disconnect while the signal fires.
        const auto slots = m_slots;
        for (const auto& entry : slots)
        {
            entry.second(args...);
        }
    }

    std::size_t size() const noexcept
    {
        return m_slots.size();
    }

private:
    std::vector<std::pair<ConnectionId, Slot>> m_slots;
    ConnectionId m_nextId = 1U;
};

} // namespace lidarsim
