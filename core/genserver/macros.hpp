#pragma once

#include <cstddef>
#include <cstdint>

#ifndef GENSERVER_PRINT_MACROS
  #define GENSERVER_PRINT_MACROS 0
#endif

#ifndef GENSERVER_SERVER_ID_TYPE
  #define GENSERVER_SERVER_ID_TYPE uint32_t
#endif

using ServerIdType = GENSERVER_SERVER_ID_TYPE;

#ifndef GENSERVER_REQUEST_ID_TYPE
  #define GENSERVER_REQUEST_ID_TYPE uint64_t
#endif

using RequestIdType = GENSERVER_REQUEST_ID_TYPE;

// Worker threads are named `prefix + server id`.
// Linux limits thread names to 15 characters plus the terminating null byte.
#ifndef GENSERVER_THREAD_NAME_PREFIX
  #define GENSERVER_THREAD_NAME_PREFIX "gsv/"
#endif

#ifndef GENSERVER_ENABLE_THREAD_NAME
  #define GENSERVER_ENABLE_THREAD_NAME 1
#elif GENSERVER_PRINT_MACROS && !GENSERVER_ENABLE_THREAD_NAME
  #pragma message("Worker threads are not named")
#endif

inline constexpr size_t MaxThreadNameLen = 15;
