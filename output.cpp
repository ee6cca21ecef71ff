#include "pch.h"

#include "output.hpp"

#include <cstdio>
#include <format>
#include <sstream>

#if _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

const char* hg_text()
{
	return "hook_grep: ";
}

bool is_a_tty(FILE* fd)
{
#ifdef _WIN32
	return _isatty(_fileno(fd));
#else
	return isatty(fileno(fd));
#endif
}

void output_sink::write(const std::string_view block)
{
	if (block.empty())
		return;

	std::lock_guard lock(_mutex);

	_os.write(block.data(), static_cast<std::streamsize>(block.size()));
}

bool output_sink::flush()
{
	std::lock_guard lock(_mutex);

	_os.flush();
	return !_os.fail();
}

std::string file_warning(const bool tty, const std::string& pathname,
	const std::string& reason)
{
	std::ostringstream ss;

	output_text(ss, tty, g_options._wa_text.c_str(), hg_text());
	output_text(ss, tty, g_options._fn_text.c_str(), pathname);
	output_text_nl(ss, tty, g_options._wa_text.c_str(),
		std::format(": {}", reason));
	return ss.str();
}

std::string warning(const bool tty, const std::string& msg)
{
	std::ostringstream ss;

	output_text_nl(ss, tty, g_options._wa_text.c_str(),
		std::format("{}{}", hg_text(), msg));
	return ss.str();
}
