/*****************************************************************/ /**
 * @file   debugging.cpp
 * @brief  Contains the implementation of `debugging.h`.
 * @date   October 2025
 *********************************************************************/
#include "debugging.h"
#include <lazyext_macros/compiler.h>

#if LAZYEXT_MSVC
  #include <intrin.h>
  #include <windows.h>
#elif defined(__APPLE__)
  #include <sys/types.h>
  #include <sys/sysctl.h>
  #include <unistd.h>
#elif defined(__linux__)
  #include <cstdio>
  #include <cstdlib>
  #include <cstring>
#endif

#include <csignal>

namespace lazyext
{
  /// @brief Raises the most appropriate signal to stop in a debugger
  static void raise_trap() noexcept
  {
#if defined(SIGTRAP)
    std::raise(SIGTRAP);
#else
    std::raise(SIGABRT);
#endif
  }

  void breakpoint() noexcept
  {
#if LAZYEXT_MSVC
    __debugbreak();
#elif LAZYEXT_GCC || LAZYEXT_CLANG
  #if defined(__i386__) || defined(__x86_64__)
    __asm__ volatile("int3");
  #else
    raise_trap();
  #endif
#else
    raise_trap();
#endif
  }

  bool is_debugger_present() noexcept
  {
#if LAZYEXT_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(__APPLE__)
    int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PID, getpid()};
    struct kinfo_proc info{};
    size_t size = sizeof(info);
    if (sysctl(mib, 4, &info, &size, nullptr, 0) != 0 || size != sizeof(info))
      return false;
    return (info.kp_proc.p_flag & P_TRACED) != 0;
#elif defined(__linux__)
    // "TracerPid:" is non-zero when a tracer is attached
    std::FILE* status = std::fopen("/proc/self/status", "r");
    if (status == nullptr)
      return false;

    static constexpr char TRACER_FIELD[] = "TracerPid:";
    char line[256];
    long tracer = 0;
    while (std::fgets(line, sizeof(line), status))
    {
      if (std::strncmp(line, TRACER_FIELD, sizeof(TRACER_FIELD) - 1) != 0)
        continue;
      tracer = std::strtol(line + sizeof(TRACER_FIELD) - 1, nullptr, 10);
      break;
    }
    std::fclose(status);
    return tracer != 0;
#else
    return false;
#endif
  }
} // namespace lazyext
