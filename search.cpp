#include "pch.h"

#include "search.hpp"
#include "types.hpp"

#include <lexertl/enums.hpp>
#include <lexertl/memory_file.hpp>
#include <boost/regex.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <variant>

file_processor select_processor(const unsigned int flags)
{
    // Use the lexertl enum operator
    using namespace lexertl;
    const bool negated = (flags & *config_flags::negate) != 0;

    if (flags & *config_flags::multiline)
    {
        return negated ?
            file_processor(negated_buffer_search()) :
            file_processor(buffer_search());
    }
    else
    {
        return negated ?
            file_processor(negated_line_search()) :
            file_processor(line_search());
    }
}

[[nodiscard]] static const char* next_line(const char* eol,
    const char* second)
{
    return eol == second ? eol : eol + 1;
}

// Drop every trailing CR/LF, not just one
[[nodiscard]] static const char* strip_eol(const char* first, const char* eol)
{
    while (eol != first && (eol[-1] == '\r' || eol[-1] == '\n'))
        --eol;

    return eol;
}

static bool process_lines(const line_search&, const matcher& m,
    const std::string& pathname, const char* first, const char* second,
    std::string& report)
{
    std::size_t line_no = 0;
    bool success = false;

    while (first != second)
    {
        // The matcher sees the line without its LF, so $ anchors at line end
        const char* eol = std::find(first, second, '\n');

        ++line_no;

        if (boost::regex_search(first, eol, m._rx))
        {
            success = true;
            report += std::format("{}:{}:", pathname, line_no);
            report.append(first, strip_eol(first, eol));
            report += '\n';
        }

        first = next_line(eol, second);
    }

    return success;
}

static bool process_lines(const negated_line_search&, const matcher& m,
    const std::string& pathname, const char* first, const char* second,
    std::string& report)
{
    while (first != second)
    {
        const char* eol = std::find(first, second, '\n');

        if (boost::regex_search(first, eol, m._rx))
            return false;

        first = next_line(eol, second);
    }

    report += pathname;
    report += '\n';
    return true;
}

static bool process_buffer(const buffer_search&, const matcher& m,
    const std::string& pathname, const char* first, const char* second,
    std::string& report)
{
    boost::cmatch what;

    if (!boost::regex_search(first, second, what, m._rx))
        return false;

    const char* start = what[0].first;
    const char* end = what[0].second;
    const auto line_no = std::count(first, start, '\n');
    // Report from the start of the physical line, even if the match
    // starts part way along it.
    const char* bol = std::find(std::reverse_iterator(start),
        std::reverse_iterator(first), '\n').base();
    const char* eol = std::find(start, second, '\n');

    report += std::format("{}:{}:", pathname, line_no + 1);
    // A match spanning lines runs past eol, otherwise the whole first
    // line is the report.
    report.append(bol, std::max(end, eol));
    report += '\n';
    return true;
}

static bool process_buffer(const negated_buffer_search&,
    const matcher& m,
    const std::string& pathname, const char* first, const char* second,
    std::string& report)
{
    if (boost::regex_search(first, second, m._rx))
        return false;

    report += pathname;
    report += '\n';
    return true;
}

bool search(const file_processor& processor, const matcher& m,
    const std::string& pathname, const char* first, const char* second,
    std::string& report)
{
    bool success = false;

    switch (static_cast<search_mode>(processor.index()))
    {
    case search_mode::line:
        success = process_lines(std::get<line_search>(processor), m,
            pathname, first, second, report);
        break;
    case search_mode::negated_line:
        success = process_lines(std::get<negated_line_search>(processor), m,
            pathname, first, second, report);
        break;
    case search_mode::buffer:
        success = process_buffer(std::get<buffer_search>(processor), m,
            pathname, first, second, report);
        break;
    case search_mode::negated_buffer:
        success = process_buffer(std::get<negated_buffer_search>(processor),
            m, pathname, first, second, report);
        break;
    default:
        break;
    }

    return success;
}

[[nodiscard]] static std::string errno_text()
{
    return std::generic_category().message(errno);
}

// Fallback for anything mmap() refuses: empty files, pipes, /proc entries.
[[nodiscard]] static std::optional<std::string>
    read_file(const std::string& pathname, std::string& contents)
{
    std::array<char, 4096> buffer{};
    auto closer = [](std::FILE* fp) { std::fclose(fp); };
    std::unique_ptr<FILE, decltype(closer)>
        fp(std::fopen(pathname.c_str(), "rb"), closer);
    std::size_t size = 0;

    if (!fp)
        return errno_text();

    do
    {
        size = std::fread(buffer.data(), 1, buffer.size(), fp.get());
        contents.append(buffer.data(), size);
    } while (size);

    // Reading a directory fails here with EISDIR
    if (std::ferror(fp.get()))
        return errno_text();

    return std::nullopt;
}

file_outcome process_file(const std::string& pathname, const matcher& m,
    const file_processor& processor, std::string& report)
{
    file_outcome outcome;
    lexertl::memory_file mf(pathname.c_str());
    std::string contents;
    const char* first = mf.data();
    const char* second = nullptr;

    outcome._pathname = pathname;

    if (first)
        second = first + mf.size();
    else
    {
        if (auto err = read_file(pathname, contents); err)
        {
            outcome._error = std::move(err);
            return outcome;
        }

        first = contents.c_str();
        second = first + contents.size();
    }

    try
    {
        outcome._matched = search(processor, m, pathname, first, second,
            report);
    }
    catch (const std::runtime_error& e)
    {
        // Boost.Regex gives up on pathological backtracking by throwing
        report.clear();
        outcome._error = e.what();
    }

    return outcome;
}
