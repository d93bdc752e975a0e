#pragma once

#include "excelpipe/core/ErrorCode.hpp"
#include <type_traits>
#include <utility>
#include <new>

namespace excelpipe {
namespace core {

/**
 * @brief Expected<T, E> - 值或错误
 *
 * 用于存储层的 IO 与结构性操作（打开、保存、插入行列）。
 * 访问 value() 前必须先检查 hasValue()。
 */
template<typename T, typename E = Error>
class Expected {
private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;

public:
    using value_type = T;
    using error_type = E;

    // ========== 构造函数 ==========

    Expected(const T& value) : has_value_(true) {
        new(&value_) T(value);
    }

    Expected(T&& value) : has_value_(true) {
        new(&value_) T(std::move(value));
    }

    Expected(const E& error) : has_value_(false) {
        new(&error_) E(error);
    }

    Expected(E&& error) : has_value_(false) {
        new(&error_) E(std::move(error));
    }

    Expected(const Expected& other) : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(other.value_);
        } else {
            new(&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(std::move(other.value_));
        } else {
            new(&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            this->~Expected();
            new(this) Expected(other);
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            this->~Expected();
            new(this) Expected(std::move(other));
        }
        return *this;
    }

    // ========== 状态检查 ==========

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    // ========== 值访问 ==========

    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }

    const T& valueOr(const T& default_value) const & noexcept {
        return has_value_ ? value_ : default_value;
    }

    T valueOr(T&& default_value) && {
        return has_value_ ? std::move(value_) : std::move(default_value);
    }

    T& operator*() & noexcept { return value_; }
    const T& operator*() const & noexcept { return value_; }

    T* operator->() noexcept { return &value_; }
    const T* operator->() const noexcept { return &value_; }

    // ========== 函数式操作 ==========

    template<typename F>
    auto map(F&& func) -> Expected<decltype(func(value_)), E> {
        if (has_value_) {
            return Expected<decltype(func(value_)), E>(func(value_));
        }
        return Expected<decltype(func(value_)), E>(error_);
    }

    template<typename F>
    auto andThen(F&& func) -> decltype(func(value_)) {
        if (has_value_) {
            return func(value_);
        }
        return decltype(func(value_))(error_);
    }

    /**
     * @brief 取值，失败时抛出异常
     */
    T& valueOrThrow() & {
        if (!has_value_) {
            raise();
        }
        return value_;
    }

    T valueOrThrow() && {
        if (!has_value_) {
            raise();
        }
        return std::move(value_);
    }

private:
    [[noreturn]] void raise() const {
        if constexpr (std::is_same_v<E, Error>) {
            throwError(error_);
        } else {
            throw E(error_);
        }
    }
};

/**
 * @brief 特化：void类型的Expected
 */
template<typename E>
class Expected<void, E> {
private:
    E error_;
    bool has_value_;

public:
    using value_type = void;
    using error_type = E;

    Expected() : has_value_(true) {}

    Expected(const E& error) : error_(error), has_value_(false) {}
    Expected(E&& error) : error_(std::move(error)), has_value_(false) {}

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }

    void valueOrThrow() const {
        if (!has_value_) {
            if constexpr (std::is_same_v<E, Error>) {
                throwError(error_);
            } else {
                throw E(error_);
            }
        }
    }
};

// ========== 类型别名 ==========

template<typename T>
using Result = Expected<T, Error>;

using VoidResult = Expected<void, Error>;

}} // namespace excelpipe::core
