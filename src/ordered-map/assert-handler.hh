#pragma once

#include <ordered-map/macros.hh>

#include <functional>
#include <source_location>
#include <string>

// Pluggable reporting for failed OM_ASSERT / OM_ASSERT_ALWAYS.
//
// Each thread has its own LIFO stack of handlers. A failure is routed to the topmost handler of the
// failing thread, or printed to stderr if that thread has none. Afterwards the program aborts, unless
// the handler throws: tests use this to observe precondition violations, applications to unwind to
// a recovery point.
//
//   {
//       auto handler = om::impl::scoped_assertion_handler([](om::impl::assertion_info const& info) {
//           throw my_precondition_error(info.message);
//       });
//       run_untrusted_plugin();
//   }
//
// A throwing handler only helps where the failing function may throw.

namespace om::impl
{
struct assertion_info
{
    std::string expression; ///< stringified condition
    std::string message;
    std::source_location location;
};

void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

/// Precondition: this thread has a handler installed.
void pop_assertion_handler();

/// Installs a handler for the current scope on the current thread.
/// Popped on scope exit, including when the handler itself throws out of the scope.
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace om::impl
