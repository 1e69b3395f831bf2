/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

namespace nsd {

template<typename Signature>
class SafeFunction;

/**
 * Wrapper around std::function which can be called without checking whether a target was set. Calling an empty
 * SafeFunction does nothing.
 * @tparam R The return type. Must be default constructible when calling an empty function.
 * @tparam Args The argument types.
 */
template<typename R, typename... Args>
class SafeFunction<R(Args...)> {
  public:
    using FunctionType = std::function<R(Args...)>;

    SafeFunction() = default;

    SafeFunction(FunctionType f) : function_(std::move(f)) {}  // NOLINT(google-explicit-constructor)

    SafeFunction& operator=(FunctionType f) {
        function_ = std::move(f);
        return *this;
    }

    SafeFunction& operator=(std::nullptr_t) {
        function_ = nullptr;
        return *this;
    }

    /**
     * Sets a new target, replacing the previous one.
     * @param f The new target, or nullptr to clear.
     */
    void set(FunctionType f) {
        function_ = std::move(f);
    }

    /**
     * Calls the target if one is set.
     * @param args The arguments to pass.
     * @return The result of the target, or a default constructed R if no target is set.
     */
    R operator()(Args... args) const {
        if (!function_) {
            if constexpr (std::is_void_v<R>) {
                return;
            } else {
                return R {};
            }
        }
        return function_(std::forward<Args>(args)...);
    }

    /**
     * @return True if a target is set.
     */
    explicit operator bool() const {
        return static_cast<bool>(function_);
    }

  private:
    FunctionType function_;
};

}  // namespace nsd
