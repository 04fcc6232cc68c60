#ifndef SCENKIT_CORE_PLATFORM_HPP_
#define SCENKIT_CORE_PLATFORM_HPP_

namespace scenkit::core {

// Host capability defaults. Components take these as overridable options so
// the unsupported-platform paths stay testable on any host.
#if defined(_WIN32)
inline constexpr bool kHostSupportsElevation = false;
inline constexpr bool kHostSupportsDetachedSessions = false;
#else
inline constexpr bool kHostSupportsElevation = true;
inline constexpr bool kHostSupportsDetachedSessions = true;
#endif

} // namespace scenkit::core

#endif // SCENKIT_CORE_PLATFORM_HPP_
