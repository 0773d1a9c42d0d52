#pragma once

#include <vector>

#include "types.hpp"

namespace colony {

// Last K positions visited by an agent. Array-backed ring buffer: once full,
// each push overwrites the oldest entry. A capacity of zero remembers nothing.
class TrailMemory {
   public:
    explicit TrailMemory(int capacity = 0) : slots(capacity > 0 ? capacity : 0), next(0), count(0) {}

    void push(const Position& p) {
        if (slots.empty())
            return;
        slots[next] = p;
        next = (next + 1) % slots.size();
        if (count < slots.size())
            count++;
    }

    bool contains(const Position& p) const {
        for (size_t i = 0; i < count; i++) {
            if (slots[i] == p)
                return true;
        }
        return false;
    }

    void clear() {
        next = 0;
        count = 0;
    }

    // Most recent entry first.
    std::vector<Position> recent() const {
        std::vector<Position> out;
        out.reserve(count);
        for (size_t i = 0; i < count; i++) {
            out.push_back(slots[(next + slots.size() - 1 - i) % slots.size()]);
        }
        return out;
    }

    size_t size() const { return count; }
    size_t capacity() const { return slots.size(); }

   private:
    std::vector<Position> slots;
    size_t next;
    size_t count;
};

}  // namespace colony
