#pragma once

#include <utility>

namespace file_icon {

// Like std::unique_ptr, but doesn't assume pointers and takes the deleter
// as an auto-typed template value parameter, which fits Win32 handles.
template <typename T, auto deleter, T default_value = nullptr>
struct unique_handle {
    T value = default_value;

    unique_handle() = default;
    explicit unique_handle(T v) : value{v} {}
    ~unique_handle() { reset(); }

    unique_handle(const unique_handle&) = delete;
    unique_handle& operator=(const unique_handle&) = delete;
    unique_handle(unique_handle&& other) noexcept : value{other.release()} {}
    unique_handle& operator=(unique_handle&& other) noexcept {
        reset(other.release());
        return *this;
    }

    [[nodiscard]] T get() const noexcept { return value; }
    explicit operator bool() const noexcept { return value != default_value; }

    T release() noexcept { return std::exchange(value, default_value); }

    void reset(T new_value = default_value) noexcept {
        T old = std::exchange(value, new_value);
        if (old != default_value) {
            deleter(old);
        }
    }
};

} // namespace file_icon
