#pragma once

// Value-or-error return for validation checks. Holds trivially copyable
// payloads only, so it needs no lifetime management of its own.

#include <type_traits>

namespace mrc {

template <class E>
class unexpected {
public:
    constexpr explicit unexpected(E e) : error_(e) {}
    constexpr const E& error() const noexcept { return error_; }
private:
    E error_;
};

template <class E>
constexpr unexpected<E> make_unexpected(E e) { return unexpected<E>(e); }

template <class T, class E>
class expected {
    static_assert(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>,
                  "expected<T,E> holds trivially copyable payloads only");
public:
    constexpr expected(const T& v) : value_(v), has_(true) {}
    constexpr expected(const unexpected<E>& ue) : error_(ue.error()), has_(false) {}

    constexpr bool has_value() const noexcept { return has_; }
    explicit constexpr operator bool() const noexcept { return has_; }
    // Only meaningful when has_value().
    constexpr const T& value() const noexcept { return value_; }
    // Only meaningful when !has_value().
    constexpr const E& error() const noexcept { return error_; }

private:
    union {
        T value_;
        E error_;
    };
    bool has_;
};

} // namespace mrc
