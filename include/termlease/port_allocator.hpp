// include/termlease/port_allocator.hpp
// Purpose: Fixed-size pool of host ports, one per active session
// Ports are [base_port, base_port + pool_size); the lowest free port is handed out first

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <set>
#include <mutex>

namespace termlease {

class PortAllocator {
public:
    // Throws ConfigError if the range does not fit in 1-65535
    PortAllocator(Port base_port, size_t pool_size);
    ~PortAllocator() = default;

    // Non-copyable, non-movable
    PortAllocator(const PortAllocator&) = delete;
    PortAllocator& operator=(const PortAllocator&) = delete;
    PortAllocator(PortAllocator&&) = delete;
    PortAllocator& operator=(PortAllocator&&) = delete;

    // Lowest free port; throws CapacityError(PORT_EXHAUSTED) when all are held
    Port acquire();

    // Idempotent; free or out-of-range ports are ignored
    void release(Port port);

    bool is_allocated(Port port) const;
    bool in_range(Port port) const noexcept;
    size_t allocated_count() const;
    size_t available_count() const;
    size_t capacity() const noexcept { return pool_size_; }
    Port base_port() const noexcept { return base_port_; }

private:
    Port base_port_;
    size_t pool_size_;

    mutable std::mutex mutex_;
    std::set<Port> allocated_ports_;
};

} // namespace termlease
