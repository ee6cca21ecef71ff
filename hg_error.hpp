#pragma once

#include <stdexcept>
#include <string>

class hg_error : public std::runtime_error
{
public:
	hg_error(const std::string& msg) :
		std::runtime_error(msg)
	{
	}
};

// Bad command line: reported together with the usage text.
class usage_error : public hg_error
{
public:
	usage_error(const std::string& msg) :
		hg_error(msg)
	{
	}
};
