#include <taskq/common/platform.hpp>

#include <cstdlib>
#include <functional>
#include <thread>

#if defined(TASKQ_OS_WINDOWS)
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #include <io.h>
    #include <windows.h>
#elif defined(TASKQ_OS_POSIX)
    #include <pthread.h>
    #include <unistd.h>
#endif

namespace taskq::common::platform {

uint64_t get_thread_id() noexcept {
#if defined(TASKQ_OS_WINDOWS)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(TASKQ_OS_MACOS)
    uint64_t tid = 0;
    ::pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(TASKQ_OS_POSIX)
    return static_cast<uint64_t>(::pthread_self());
#else
    return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
}

std::string get_env(std::string_view name) {
    const std::string key(name);
#if defined(TASKQ_OS_WINDOWS)
    char* value = nullptr;
    size_t len  = 0;
    if (::_dupenv_s(&value, &len, key.c_str()) != 0 || value == nullptr) {
        return {};
    }
    std::string result(value);
    std::free(value);
    return result;
#else
    if (const char* value = std::getenv(key.c_str())) {
        return value;
    }
    return {};
#endif
}

bool is_terminal(int fd) noexcept {
    if (fd < 0) {
        return false;
    }
#if defined(TASKQ_OS_WINDOWS)
    return ::_isatty(fd) != 0;
#elif defined(TASKQ_OS_POSIX)
    return ::isatty(fd) != 0;
#else
    return false;
#endif
}

}  // namespace taskq::common::platform
