#pragma once

#include <cstddef>

namespace slb {

// Position on the upstream ring for one traffic class. Not synchronized: the
// dispatcher holds its mutex across read, scan and advance.
class RoundRobinCursor {
public:
    RoundRobinCursor(size_t ring_size, size_t step)
        : ring_size_(ring_size), step_(step), position_(0) {}

    size_t position() const { return position_; }

    // Ring index of the i-th candidate starting from the current position.
    size_t candidate(size_t i) const {
        return (position_ + i) % ring_size_;
    }

    // Moves past the chosen index by the configured step.
    void advance_from(size_t chosen) {
        position_ = (chosen + step_) % ring_size_;
    }

    void reset(size_t value) {
        position_ = value % ring_size_;
    }

private:
    size_t ring_size_;
    size_t step_;
    size_t position_;
};

} // namespace slb
