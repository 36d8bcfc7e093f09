#pragma once

#include <atomic>
#include <exception>
#include <string>

#include "Base.hpp"
#include "Log.hpp"

namespace Strata
{
    /**
     * @brief Called when an internal invariant does not hold
     *
     * The world is in an unrecoverable state once a handler runs, so a handler
     * must not return normally: it either terminates or throws. The default
     * handler logs at Fatal and calls std::terminate.
     */
    using ContractViolationHandler = void (*)(const char* expression, const char* message, const char* file, int line);

    namespace Detail
    {
        [[noreturn]] inline void DefaultContractViolation(const char* expression, const char* message, const char* file, int line)
        {
            std::string text = std::string(message) + " (" + expression + ") at " + file + ":" + std::to_string(line);
            Log::Fatal("Contract", text);
            std::terminate();
        }

        inline std::atomic<ContractViolationHandler>& ContractHandlerSlot() noexcept
        {
            static std::atomic<ContractViolationHandler> s_handler{&DefaultContractViolation};
            return s_handler;
        }

        [[noreturn]] STRATA_NOINLINE inline void ContractViolation(const char* expression, const char* message, const char* file, int line)
        {
            ContractHandlerSlot().load(std::memory_order_acquire)(expression, message, file, line);
            // A handler that returns is treated like the default one
            std::terminate();
        }
    }

    /**
     * @brief Install a contract violation handler, returning the previous one
     * @param handler New handler, or nullptr to restore the default
     */
    inline ContractViolationHandler SetContractViolationHandler(ContractViolationHandler handler) noexcept
    {
        return Detail::ContractHandlerSlot().exchange(handler ? handler : &Detail::DefaultContractViolation, std::memory_order_acq_rel);
    }
}

// Invariant check kept in every build configuration
#define STRATA_VERIFY(condition, message)                                                           \
    do                                                                                              \
    {                                                                                               \
        if (!(condition)) STRATA_UNLIKELY                                                           \
            ::Strata::Detail::ContractViolation(#condition, message, __FILE__, __LINE__);           \
    } while (false)
