// src/port_allocator.cpp
// Implementation of the session port pool

#include "termlease/port_allocator.hpp"

namespace termlease {

PortAllocator::PortAllocator(Port base_port, size_t pool_size)
    : base_port_(base_port)
    , pool_size_(pool_size) {
    if (base_port_ == 0 || pool_size_ == 0 ||
        static_cast<size_t>(base_port_) + pool_size_ > 65536) {
        throw Errors::invalid_port_range(base_port_, pool_size_);
    }
}

Port PortAllocator::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (allocated_ports_.size() >= pool_size_) {
        throw Errors::port_exhausted(pool_size_);
    }

    // allocated_ports_ is ordered, so the first gap is the lowest free port
    Port candidate = base_port_;
    for (Port held : allocated_ports_) {
        if (held != candidate) {
            break;
        }
        ++candidate;
    }

    allocated_ports_.insert(candidate);
    return candidate;
}

void PortAllocator::release(Port port) {
    std::lock_guard<std::mutex> lock(mutex_);
    allocated_ports_.erase(port);
}

bool PortAllocator::is_allocated(Port port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocated_ports_.find(port) != allocated_ports_.end();
}

bool PortAllocator::in_range(Port port) const noexcept {
    return port >= base_port_ && static_cast<size_t>(port) < static_cast<size_t>(base_port_) + pool_size_;
}

size_t PortAllocator::allocated_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocated_ports_.size();
}

size_t PortAllocator::available_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_size_ - allocated_ports_.size();
}

} // namespace termlease
