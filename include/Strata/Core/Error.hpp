#pragma once

#include <cstdint>

namespace Strata
{
    enum class ErrorCode : std::uint32_t
    {
        None = 0,

        // Operation on a dead or never-allocated entity
        EntityNotFound,

        // Entity index space exhausted
        CapacityExceeded
    };

    struct Error
    {
        ErrorCode code;
        const char* message;

        // A null message falls back to the code's default text
        constexpr Error(ErrorCode errorCode = ErrorCode::None, const char* text = nullptr) noexcept
            : code(errorCode), message(text ? text : GetDefaultMessage(errorCode))
        {}

        // Errors compare by code only
        [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept
        {
            return code == other.code;
        }

        [[nodiscard]] static constexpr const char* GetDefaultMessage(ErrorCode code) noexcept
        {
            switch (code)
            {
                case ErrorCode::None: return "No error";
                case ErrorCode::EntityNotFound: return "Entity not found";
                case ErrorCode::CapacityExceeded: return "Capacity exceeded";
                default: return "Unspecified error";
            }
        }
    };

    inline constexpr Error MakeError(ErrorCode code, const char* message = nullptr) noexcept
    {
        return Error(code, message);
    }
}
