//
// Created by Andrea on 27/08/2025.
//

#pragma once

#include "logger/Logger.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

namespace core::recovery {
    struct RetryConfig {
        bool enabled = true;
        int maxRetries = 3; // additional attempts after the first one
        std::chrono::milliseconds delay{2000};
        // Errors matching this predicate are rethrown at once, without waiting
        std::function<bool(const std::exception &)> isNonRetryable;
    };

    namespace detail {
        template<typename T, typename = void>
        struct has_empty : std::false_type {
        };

        template<typename T>
        struct has_empty<T, std::void_t<decltype(std::declval<const T &>().empty())> > : std::true_type {
        };

        template<typename T>
        struct is_optional : std::false_type {
        };

        template<typename T>
        struct is_optional<std::optional<T> > : std::true_type {
        };

        /**
         * @brief false, nullopt, null pointers and empty containers count as a failed attempt
         */
        template<typename T>
        bool isFalsy(const T &value) {
            if constexpr (std::is_same_v<T, bool>) {
                return !value;
            } else if constexpr (is_optional<T>::value) {
                return !value.has_value();
            } else if constexpr (std::is_pointer_v<T>) {
                return value == nullptr;
            } else if constexpr (has_empty<T>::value) {
                return value.empty();
            } else if constexpr (std::is_constructible_v<bool, const T &>) {
                return !static_cast<bool>(value);
            } else {
                return false;
            }
        }
    }

    /**
     * @brief Re-invokes an operation until it yields a truthy result
     *
     * A falsy result is retried exactly like a thrown error. Errors accepted by
     * RetryConfig::isNonRetryable propagate immediately. When every attempt fails the
     * neutral value T{} is returned, so callers must treat it as the failure signal.
     */
    class RetryPolicy {
    public:
        explicit RetryPolicy(RetryConfig config) : config_(std::move(config)) {
        }

        template<typename Func>
        auto execute(Func &&func, const std::string &operationName = "operation") -> decltype(func()) {
            using ReturnType = decltype(func());
            static_assert(std::is_default_constructible_v<ReturnType>,
                          "retried operations must return a default constructible result");

            const int attempts = config_.enabled ? config_.maxRetries + 1 : 1;

            for (int attempt = 1; attempt <= attempts; ++attempt) {
                try {
                    ReturnType result = func();
                    if (!detail::isFalsy(result)) {
                        if (attempt > 1) {
                            Logger::logInfo("[RetryPolicy] " + operationName + " succeeded on attempt " +
                                            std::to_string(attempt) + "/" + std::to_string(attempts));
                        }
                        return result;
                    }
                    if (attempt > 1) {
                        Logger::logInfo("[RetryPolicy] " + operationName + " attempt " + std::to_string(attempt) +
                                        "/" + std::to_string(attempts) + " returned failure");
                    }
                } catch (const std::exception &e) {
                    if (config_.isNonRetryable && config_.isNonRetryable(e)) {
                        throw;
                    }
                    Logger::logWarning("[RetryPolicy] " + operationName + " attempt " + std::to_string(attempt) +
                                       "/" + std::to_string(attempts) + " failed: " + e.what());
                }

                if (attempt < attempts) {
                    Logger::logInfo("[RetryPolicy] " + operationName + " will retry in " +
                                    std::to_string(config_.delay.count()) + "ms...");
                    std::this_thread::sleep_for(config_.delay);
                }
            }

            Logger::logError("[RetryPolicy] " + operationName + " failed after " + std::to_string(attempts) +
                             " attempts");
            return ReturnType{};
        }

        const RetryConfig &config() const { return config_; }

    private:
        RetryConfig config_;
    };

    template<typename Func>
    auto withRetry(Func &&func, const RetryConfig &config, const std::string &operationName = "operation")
        -> decltype(func()) {
        RetryPolicy policy(config);
        return policy.execute(std::forward<Func>(func), operationName);
    }
} // namespace core::recovery
