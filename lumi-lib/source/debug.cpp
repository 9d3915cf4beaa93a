/**
 * @file debug.cpp
 *
 */

#include "debug.h"
#include <cstdio>
#include <cstdlib>
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#include <fmt/format.h>
#include <fstream>
#include <string>

namespace
{
const int kMaxFrames = 64;

// TracerPid in /proc/self/status is non-zero when a debugger is attached

bool DebuggerAttached()
{
	std::ifstream status("/proc/self/status");
	std::string line;

	while (std::getline(status, line))
	{
		if (line.compare(0, 10, "TracerPid:") == 0)
		{
			return std::atoi(line.c_str() + 10) != 0;
		}
	}

	return false;
}

// Symbol lines look like 'libfoo.so(_ZN4lumi6matrixIdE3SetEmd+0x1c) [0x7f...]'

std::string Demangle(const std::string& theLine, void* theAddress)
{
	const auto open = theLine.find('(');
	const auto plus = theLine.find('+', open);

	if (open == std::string::npos || plus == std::string::npos)
	{
		return theLine;
	}

	const std::string mangled = theLine.substr(open + 1, plus - open - 1);

	if (mangled.empty())
	{
		Dl_info info;
		return (dladdr(theAddress, &info) != 0 && info.dli_fname) ? info.dli_fname : "<no symbol>";
	}

	int status = 0;
	char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);

	if (status != 0 || demangled == nullptr)
	{
		return mangled;
	}

	std::string ret(demangled);
	std::free(demangled);

	return ret;
}

void PrintBacktrace()
{
	void* frames[kMaxFrames];

	const int count = backtrace(frames, kMaxFrames);
	char** symbols = backtrace_symbols(frames, count);

	if (symbols == nullptr)
	{
		return;
	}

	for (int i = 0; i < count; i++)
	{
		fmt::print("{}: {}\n", i, Demangle(symbols[i], frames[i]));
	}

	std::free(symbols);
}
}  // namespace

namespace lumi
{
bool AssertionFailed(const char* expr, long line, const char* fn, const char* file)
{
	fmt::print("Assertion ({}) failed at: {}::{}:{}\n\n", expr, file, fn, line);
	PrintBacktrace();
	return DebuggerAttached();
}

void Abort()
{
	PrintBacktrace();
	std::fflush(stdout);
	std::abort();
}
}  // namespace lumi
