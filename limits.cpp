#include "pch.h"

#include "limits.hpp"

#include <algorithm>
#include <cerrno>

#ifndef _WIN32
#include <sys/resource.h>
#endif

std::uint64_t nofile_target(const std::uint64_t hard)
{
    return std::min(hard, g_max_nofile_limit);
}

file_limit adjust_open_file_limit()
{
    file_limit limit;
#ifdef _WIN32
    // No descriptor limit to speak of
    return limit;
#else
    rlimit rl{};

    if (::getrlimit(RLIMIT_NOFILE, &rl) != 0)
    {
        limit._result = file_limit::result::failed;
        limit._error = std::error_code(errno, std::generic_category());
        return limit;
    }

    const std::uint64_t hard = rl.rlim_max == RLIM_INFINITY ?
        UINT64_MAX :
        static_cast<std::uint64_t>(rl.rlim_max);

    limit._soft = rl.rlim_cur == RLIM_INFINITY ?
        UINT64_MAX :
        static_cast<std::uint64_t>(rl.rlim_cur);
    limit._target = nofile_target(hard);

    if (limit._soft >= limit._target)
        return limit;

    rl.rlim_cur = static_cast<rlim_t>(limit._target);

    if (::setrlimit(RLIMIT_NOFILE, &rl) != 0)
    {
        limit._result = file_limit::result::failed;
        limit._error = std::error_code(errno, std::generic_category());
    }
    else
        limit._result = file_limit::result::raised;

    return limit;
#endif
}
