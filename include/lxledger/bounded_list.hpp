#ifndef LXLEDGER_BOUNDED_LIST_HPP
#define LXLEDGER_BOUNDED_LIST_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace lxledger {

// =============================================================================
// BoundedList - fixed-capacity ordered collection
// =============================================================================

// push_back() throws std::length_error past Capacity instead of truncating;
// callers check full() first
template<typename T, size_t Capacity>
class BoundedList {
public:
    static constexpr size_t capacity() { return Capacity; }

    void push_back(const T& value) {
        if (size_ == Capacity) {
            throw std::length_error("BoundedList capacity exceeded");
        }
        items_[size_++] = value;
    }

    bool full() const { return size_ == Capacity; }
    bool empty() const { return size_ == 0; }
    size_t size() const { return size_; }

    const T& operator[](size_t i) const { return items_[i]; }

    const T* begin() const { return items_.data(); }
    const T* end() const { return items_.data() + size_; }

    bool contains(const T& value) const {
        return std::find(begin(), end(), value) != end();
    }

    std::vector<T> to_vector() const { return std::vector<T>(begin(), end()); }

private:
    std::array<T, Capacity> items_{};
    size_t size_{0};
};

} // namespace lxledger

#endif // LXLEDGER_BOUNDED_LIST_HPP
