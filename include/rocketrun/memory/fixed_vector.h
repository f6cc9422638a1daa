#pragma once
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace rocketrun::memory {

// Vector with in-place storage for at most Capacity elements. Never
// allocates. Restricted to trivially copyable types so the container itself
// stays trivially copyable and elements never need explicit destruction.
template <class T, std::size_t Capacity>
class FixedVector {
    static_assert(Capacity > 0, "Capacity must be > 0");
    static_assert(std::is_trivially_copyable_v<T>, "FixedVector holds trivially copyable types only");
    static_assert(std::is_trivially_destructible_v<T>, "FixedVector holds trivially destructible types only");

public:
    using value_type     = T;
    using iterator       = T*;
    using const_iterator = const T*;

    FixedVector() = default;

    [[nodiscard]] static constexpr std::size_t capacity() noexcept { return Capacity; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] bool full() const noexcept { return size_ == Capacity; }

    // Returns false (and stores nothing) when the vector is full.
    template <class... Args>
    [[nodiscard]] bool emplace_back(Args&&... args) {
        if (full()) return false;
        ::new (static_cast<void*>(storage_ + size_ * sizeof(T))) T(std::forward<Args>(args)...);
        ++size_;
        return true;
    }

    [[nodiscard]] bool push_back(const T& value) { return emplace_back(value); }

    // Stable removal of every element matching `pred`; returns the number removed.
    template <class Pred>
    std::size_t erase_if(Pred&& pred) {
        std::size_t kept = 0;
        for (std::size_t i = 0; i < size_; ++i) {
            if (pred(data()[i])) continue;
            if (kept != i) data()[kept] = data()[i];
            ++kept;
        }
        const std::size_t removed = size_ - kept;
        size_ = kept;
        return removed;
    }

    void clear() noexcept { size_ = 0; }

    T*       data() noexcept { return std::launder(reinterpret_cast<T*>(storage_)); }
    const T* data() const noexcept { return std::launder(reinterpret_cast<const T*>(storage_)); }

    T&       operator[](std::size_t i) noexcept { return data()[i]; }
    const T& operator[](std::size_t i) const noexcept { return data()[i]; }

    iterator       begin() noexcept { return data(); }
    iterator       end() noexcept { return data() + size_; }
    const_iterator begin() const noexcept { return data(); }
    const_iterator end() const noexcept { return data() + size_; }

private:
    alignas(T) unsigned char storage_[sizeof(T) * Capacity]{};
    std::size_t size_ = 0;
};

} // namespace rocketrun::memory
