#ifndef TXLOG_COMMON_HPP
#define TXLOG_COMMON_HPP

#include <cstddef>

namespace txlog {

#ifdef TXLOG_TRACE_OWNERSHIP
constexpr bool TRACE_OWNERSHIP = true;
#else
constexpr bool TRACE_OWNERSHIP = false;
#endif

// owners a popped node may have when its value is moved out
constexpr long RECLAIM_USE_COUNT = 1;

constexpr std::size_t DEMO_DEFAULT_ENTRIES = 3;

} // namespace txlog

#endif // TXLOG_COMMON_HPP
