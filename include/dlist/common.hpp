#ifndef DLIST_COMMON_HPP
#define DLIST_COMMON_HPP

#include <cstddef>

namespace dlist {

#ifdef DLIST_CHECK_INVARIANTS
constexpr bool CHECK_INVARIANTS = true;  // validate() after every mutation
#else
constexpr bool CHECK_INVARIANTS = false;
#endif

constexpr const char* LOG_TIME_FORMAT = "%Y-%m-%d %H:%M:%S";
constexpr std::size_t LOG_TIME_BUFFER = 20;

} // namespace dlist

#endif // DLIST_COMMON_HPP
