/**
 * @file plugin_configuration.cpp
 *
 */

#include "plugin_configuration.h"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <stdexcept>

using namespace lumi;

std::string plugin_configuration::GetValue(const std::string& key) const
{
	const auto it = itsOptions.find(key);

	if (it == itsOptions.end() || it->second.empty())
	{
		return "";
	}

	if (it->second.size() > 1)
	{
		throw std::runtime_error(
		    fmt::format("{}: key '{}' has {} values, expected one", ClassName(), key, it->second.size()));
	}

	return it->second.front();
}

std::ostream& plugin_configuration::Write(std::ostream& file) const
{
	configuration::Write(file);

	file << "<" << ClassName() << ">" << std::endl;
	file << "__itsName__ " << itsName << std::endl;

	for (const auto& option : itsOptions)
	{
		file << fmt::format("__{}__ {}", option.first, fmt::join(option.second, " ")) << std::endl;
	}

	return file;
}
