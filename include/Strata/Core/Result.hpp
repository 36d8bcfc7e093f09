#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include "Base.hpp"
#include "Error.hpp"

namespace Strata
{
    template<typename E>
    struct ErrorValue
    {
        E value;

        constexpr explicit ErrorValue(const E& e) : value(e) {}
        constexpr explicit ErrorValue(E&& e) : value(std::move(e)) {}
    };

    template<typename E>
    constexpr ErrorValue<std::decay_t<E>> Err(E&& e)
    {
        return ErrorValue<std::decay_t<E>>(std::forward<E>(e));
    }

    struct OkTag {};
    constexpr OkTag OK{};

    /**
     * @brief Value-or-error return type for recoverable failures
     *
     * Absence that callers are expected to handle (missing component, dead entity)
     * is reported with nullptr / std::optional instead. Result is reserved for
     * operations that can fail for reasons outside the caller's control, such as
     * running out of entity indices.
     */
    template<typename T, typename E = Error>
    class Result
    {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference type");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = T;
        using ErrorType = E;

        constexpr Result(const T& value) : m_value(value), m_hasValue(true) {}
        constexpr Result(T&& value) : m_value(std::move(value)), m_hasValue(true) {}
        constexpr Result(const ErrorValue<E>& err) : m_error(err.value), m_hasValue(false) {}
        constexpr Result(ErrorValue<E>&& err) : m_error(std::move(err.value)), m_hasValue(false) {}

        Result(const Result& other) : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                std::construct_at(&m_value, other.m_value);
            else
                std::construct_at(&m_error, other.m_error);
        }

        Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                std::construct_at(&m_value, std::move(other.m_value));
            else
                std::construct_at(&m_error, std::move(other.m_error));
        }

        Result& operator=(Result other)
        {
            Destroy();
            m_hasValue = other.m_hasValue;
            if (m_hasValue)
                std::construct_at(&m_value, std::move(other.m_value));
            else
                std::construct_at(&m_error, std::move(other.m_error));
            return *this;
        }

        ~Result()
        {
            Destroy();
        }

        [[nodiscard]] constexpr bool IsOk() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsErr() const noexcept { return !m_hasValue; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr T& Value() &
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr const T& Value() const&
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return m_value;
        }

        constexpr T&& Value() &&
        {
            STRATA_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return std::move(m_value);
        }

        constexpr const E& Error() const&
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

        constexpr T& operator*() & { return Value(); }
        constexpr const T& operator*() const& { return Value(); }
        constexpr T&& operator*() && { return std::move(*this).Value(); }

        constexpr T* operator->() noexcept { return &Value(); }
        constexpr const T* operator->() const noexcept { return &Value(); }

        template<typename U>
        [[nodiscard]] constexpr T ValueOr(U&& defaultValue) const&
        {
            return m_hasValue ? m_value : static_cast<T>(std::forward<U>(defaultValue));
        }

    private:
        void Destroy() noexcept
        {
            if (m_hasValue)
                std::destroy_at(&m_value);
            else
                std::destroy_at(&m_error);
        }

        union
        {
            T m_value;
            E m_error;
        };
        bool m_hasValue;
    };

    template<typename E>
    class Result<void, E>
    {
    public:
        using ValueType = void;
        using ErrorType = E;

        constexpr Result() noexcept : m_error(), m_hasValue(true) {}
        constexpr Result(OkTag) noexcept : m_error(), m_hasValue(true) {}
        constexpr Result(const ErrorValue<E>& err) : m_error(err.value), m_hasValue(false) {}
        constexpr Result(ErrorValue<E>&& err) : m_error(std::move(err.value)), m_hasValue(false) {}

        [[nodiscard]] constexpr bool IsOk() const noexcept { return m_hasValue; }
        [[nodiscard]] constexpr bool IsErr() const noexcept { return !m_hasValue; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return m_hasValue; }

        constexpr const E& Error() const&
        {
            STRATA_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

    private:
        E m_error;
        bool m_hasValue;
    };

    inline Result<void, Error> Ok()
    {
        return Result<void, Error>(OK);
    }
}
