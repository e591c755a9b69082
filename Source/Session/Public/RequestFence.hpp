#pragma once

#include <cstdint>

/// Monotonic generation counter. Each new request takes a ticket; results carrying an
/// older ticket belong to a superseded request and must be dropped.
class RequestFence
{
  public:
    using Ticket = std::uint64_t;

    /// Invalidates every outstanding ticket and returns the new current one.
    Ticket advance() noexcept
    {
        return ++m_generation;
    }

    bool is_current(Ticket ticket) const noexcept
    {
        return ticket == m_generation;
    }

    Ticket current() const noexcept
    {
        return m_generation;
    }

  private:
    Ticket m_generation{0};
};
