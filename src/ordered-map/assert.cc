#include "assert.hh"

#include <ordered-map/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#ifdef OM_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
using handler_fn = std::move_only_function<void(om::impl::assertion_info const&)>;

// every thread unwinds to its own recovery points, so handlers are installed per thread
thread_local std::vector<handler_fn> t_assertion_handlers;

// serializes default reports from concurrent readers and writers so lines do not interleave
std::mutex g_report_mutex;

void report_to_stderr(om::impl::assertion_info const& info)
{
    auto const lock = std::lock_guard(g_report_mutex);
    std::cerr << "Assertion failed: " << info.expression << '\n'
              << "  Message:  " << info.message << '\n'
              << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n"
              << "  Thread:   " << std::this_thread::get_id() << '\n';
    std::cerr.flush();
}

#ifdef OM_OS_LINUX
// /proc/self/status reports a non-zero TracerPid while a debugger is attached
bool linux_tracer_attached()
{
    auto* const f = std::fopen("/proc/self/status", "r");
    if (f == nullptr)
        return false;

    auto tracer_pid = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), f) != nullptr)
    {
        if (std::strncmp(line, "TracerPid:", 10) != 0)
            continue;
        if (std::sscanf(line + 10, "%d", &tracer_pid) != 1)
            tracer_pid = 0;
        break;
    }

    std::fclose(f);
    return tracer_pid != 0;
}
#endif
} // namespace

void om::impl::push_assertion_handler(handler_fn handler)
{
    t_assertion_handlers.push_back(std::move(handler));
}

void om::impl::pop_assertion_handler()
{
    OM_ASSERT_ALWAYS(!t_assertion_handlers.empty(), "no assertion handler installed on this thread");
    t_assertion_handlers.pop_back();
}

om::impl::scoped_assertion_handler::scoped_assertion_handler(handler_fn handler)
{
    push_assertion_handler(std::move(handler));
}

om::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

void om::impl::handle_assert_failure(char const* expression, char const* message, std::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (t_assertion_handlers.empty())
        report_to_stderr(info);
    else
        t_assertion_handlers.back()(info);
}

bool om::impl::is_debugger_connected() noexcept
{
#if defined(OM_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(OM_OS_LINUX)
    return linux_tracer_attached();
#else
    return false;
#endif
}

void om::impl::perform_abort() noexcept
{
    std::abort();
}
