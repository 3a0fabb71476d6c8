#pragma once

#include <ordered-map/macros.hh>

#include <source_location>

// Runtime checks for programmer errors.
//
// How the library reports problems:
//   - om::optional / bool     -> expected outcomes, e.g. a key that is not in the map
//   - std::bad_alloc          -> the memory resource could not grow a container, which stays unchanged
//   - OM_ASSERT               -> broken preconditions: position out of bounds, value() of an empty
//                                optional, stable append without capacity, key index out of sync
//
// A failed assertion reports through assert-handler.hh, breaks into an attached debugger and aborts.
// Never assert on input the caller could not have validated.
//
//   OM_ASSERT(0 <= i && i < size(), "index out of bounds");
//   OM_ASSERT_ALWAYS(p != nullptr, "memory resource returned nullptr instead of throwing");

/// Checked when OM_ASSERT_ENABLED (see macros.hh), otherwise compiled but never evaluated.
#define OM_ASSERT(cond, msg) OM_IMPL_ASSERT(cond, msg)

/// Checked in every build mode.
#define OM_ASSERT_ALWAYS(cond, msg) OM_IMPL_ASSERT_ALWAYS(cond, msg)

/// Breaks into the debugger if one is attached, no-op otherwise.
#define OM_DEBUG_BREAK() OM_IMPL_DEBUG_BREAK()

#define OM_BREAK_AND_ABORT() (OM_DEBUG_BREAK(), ::om::impl::perform_abort())

namespace om::impl
{
// reports to the current thread's handler (or stderr), does not abort by itself
OM_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, std::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace om::impl

// the break has to happen inside the macro so the debugger stops at the failing line

#if defined(OM_COMPILER_MSVC)
#define OM_IMPL_DEBUG_BREAK() (::om::impl::is_debugger_connected() ? __debugbreak() : void(0))
#elif defined(OM_COMPILER_POSIX)
// SIGTRAP == 5, declared here instead of including <csignal> everywhere
extern "C" int raise(int) noexcept;
#define OM_IMPL_DEBUG_BREAK() (::om::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#else
#define OM_IMPL_DEBUG_BREAK() void(0)
#endif

#define OM_IMPL_ASSERT_ALWAYS(cond, msg)                                                      \
    do                                                                                        \
    {                                                                                         \
        if (!(cond)) [[unlikely]]                                                             \
        {                                                                                     \
            ::om::impl::handle_assert_failure(#cond, msg, ::std::source_location::current()); \
            OM_BREAK_AND_ABORT();                                                             \
        }                                                                                     \
    } while (false)

#if OM_ASSERT_ENABLED
#define OM_IMPL_ASSERT(cond, msg) OM_IMPL_ASSERT_ALWAYS(cond, msg)
#else
#define OM_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        OM_UNUSED(cond);          \
        OM_UNUSED(msg);           \
    } while (false)
#endif
