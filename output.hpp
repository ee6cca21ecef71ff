#pragma once

#include "colours.hpp"
#include "types.hpp"

#include <cstdio>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

extern options g_options;

bool is_a_tty(FILE* fd);

const char* hg_text();

inline bool use_colour(const bool tty)
{
	return g_options._colour == colour::always ||
		(g_options._colour == colour::automatic && tty);
}

template<class CharT, class Traits>
void output_text(std::basic_ostream<CharT, Traits>& os, const bool tty,
	const CharT* szColour, const std::basic_string_view<CharT> text)
{
	if (use_colour(tty))
	{
		os << szColour;

		if (!g_options._ne)
			os << szEraseEOL;
	}

	os << text;

	if (use_colour(tty))
	{
		os << szDefaultText;

		if (!g_options._ne)
			os << szEraseEOL;
	}
}

template<class CharT, class Traits>
void output_text(std::basic_ostream<CharT, Traits>& os, const bool tty,
	const CharT* szColour, const std::basic_string<CharT>& text)
{
	output_text(os, tty, szColour, std::string_view(text));
}

template<class CharT, class Traits>
void output_text(std::basic_ostream<CharT, Traits>& os, const bool tty,
	const CharT* szColour, const CharT* text)
{
	output_text(os, tty, szColour, std::string_view(text));
}

template<class CharT, class Traits>
void output_text_nl(std::basic_ostream<CharT, Traits>& os, const bool tty,
	const CharT* szColour, const std::basic_string_view<CharT> text)
{
	output_text(os, tty, szColour, text);
	os << '\n';
}

template<class CharT, class Traits>
void output_text_nl(std::basic_ostream<CharT, Traits>& os, const bool tty,
	const CharT* szColour, const CharT* text)
{
	output_text_nl(os, tty, szColour, std::string_view(text));
}

template<class CharT, class Traits>
void output_text_nl(std::basic_ostream<CharT, Traits>& os, const bool tty,
	const CharT* szColour, const std::basic_string<CharT>& text)
{
	output_text_nl(os, tty, szColour, std::string_view(text));
}

// Shared destination for report blocks.
// Each write() lands as one contiguous block, whichever thread issues it.
struct output_sink
{
	std::ostream& _os;
	const bool _tty;
	std::mutex _mutex;

	output_sink(std::ostream& os, const bool tty) :
		_os(os),
		_tty(tty)
	{
	}

	output_sink(const output_sink&) = delete;
	output_sink& operator=(const output_sink&) = delete;

	void write(const std::string_view block);
	bool flush();
};

// "hook_grep: <pathname>: <reason>" with the pathname in the fn colour
std::string file_warning(const bool tty, const std::string& pathname,
	const std::string& reason);
std::string warning(const bool tty, const std::string& msg);
