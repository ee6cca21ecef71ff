#pragma once

#include <cstdint>
#include <system_error>

// Cap on the open file soft limit we ask for. Going higher breaks code
// that loops over every possible descriptor.
constexpr std::uint64_t g_max_nofile_limit = 0x100000;

struct file_limit
{
    enum class result
    {
        raised, sufficient, failed
    };

    result _result = result::sufficient;
    std::uint64_t _soft = 0;
    std::uint64_t _target = 0;
    std::error_code _error;
};

// hard == UINT64_MAX means unlimited
[[nodiscard]] std::uint64_t nofile_target(const std::uint64_t hard);

// Raise the soft RLIMIT_NOFILE to nofile_target(hard), never lowering it.
// Many workers each hold a file open at once.
file_limit adjust_open_file_limit();
