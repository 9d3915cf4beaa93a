/**
 * @file json_parser.cpp
 *
 */

#include "json_parser.h"
#include "logger.h"
#include "util.h"
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <fmt/format.h>
#include <sstream>
#include <stdexcept>

using namespace lumi;
using namespace std;

namespace
{
typedef boost::property_tree::ptree ptree;

template <typename T>
boost::optional<T> ReadElement(const ptree& pt, const string& name)
{
	const auto child = pt.get_child_optional(name);

	if (!child)
	{
		return boost::none;
	}

	try
	{
		return child->get_value<T>();
	}
	catch (const exception& e)
	{
		throw runtime_error(fmt::format("Error parsing key {}: {}", name, e.what()));
	}
}

vector<level> LevelsFromString(const string& levelType, const string& levelValues)
{
	const auto type = LPStringToLevelType.find(boost::algorithm::to_lower_copy(levelType));

	if (type == LPStringToLevelType.end())
	{
		throw runtime_error(fmt::format("Unknown level type: {}", levelType));
	}

	// "100-200-50" style ranges are integers, plain lists may have decimals
	vector<double> values;

	if (levelValues.find('-') != string::npos)
	{
		const auto expanded = util::ExpandString(levelValues);
		values.assign(expanded.begin(), expanded.end());
	}
	else
	{
		values = util::Split<double>(levelValues, ",");
	}

	vector<level> levels;
	levels.reserve(values.size());

	for (double value : values)
	{
		levels.push_back(level(type->second, value));
	}

	return levels;
}

void ReadLevels(const ptree& pt, configuration& conf)
{
	const auto levelType = ReadElement<string>(pt, "leveltype");
	const auto levelValues = ReadElement<string>(pt, "levels");

	if (!levelType && !levelValues)
	{
		return;
	}

	if (!levelType || !levelValues)
	{
		throw runtime_error("Both 'leveltype' and 'levels' must be defined");
	}

	conf.Levels(LevelsFromString(levelType.get(), levelValues.get()));
}

void ReadForecastTypes(const ptree& pt, configuration& conf)
{
	if (const auto ftypes = ReadElement<string>(pt, "forecast_type"))
	{
		conf.ForecastTypes(util::ForecastTypesFromString(ftypes.get()));
	}
}

void ReadThreadCount(const ptree& pt, configuration& conf)
{
	if (const auto threads = ReadElement<short>(pt, "thread_count"))
	{
		if (threads.get() == 0 || threads.get() < -1)
		{
			throw runtime_error(fmt::format("Invalid thread_count: {}", threads.get()));
		}

		conf.ThreadCount(threads.get());
	}
}

void ReadDebugState(const ptree& pt)
{
	if (const auto state = ReadElement<string>(pt, "debug_level"))
	{
		const auto it = LPStringToDebugState.find(boost::algorithm::to_lower_copy(state.get()));

		if (it == LPStringToDebugState.end())
		{
			throw runtime_error(fmt::format("Invalid debug_level: {}", state.get()));
		}

		logger::MainDebugState = it->second;
	}
}

// "origintime" : "2024-01-31 00:00:00" or "origintimes" : "<time>,<time>,..."

vector<raw_time> ReadOriginTimes(const ptree& pt)
{
	vector<raw_time> ret;

	if (const auto time = ReadElement<string>(pt, "origintime"))
	{
		ret.push_back(raw_time(time.get()));
	}
	else if (const auto times = ReadElement<string>(pt, "origintimes"))
	{
		for (const auto& str : util::Split(times.get(), ","))
		{
			ret.push_back(raw_time(str));
		}
	}

	return ret;
}

/*
 * Steps are one of
 * - "times" : "00:00,03:00"
 * - "hours" : "0-12-3"
 * - "start_time" : "00:00", "stop_time" : "12:00", "step" : "03:00"
 */

vector<time_duration> ReadSteps(const ptree& pt, configuration& conf)
{
	vector<time_duration> steps;

	try
	{
		if (const auto times = ReadElement<string>(pt, "times"))
		{
			for (const auto& str : util::Split(times.get(), ","))
			{
				steps.push_back(time_duration(str));
			}
		}
		else if (const auto hours = ReadElement<string>(pt, "hours"))
		{
			for (int hour : util::ExpandString(hours.get()))
			{
				steps.push_back(ONE_HOUR * hour);
			}
		}
		else if (const auto start = ReadElement<string>(pt, "start_time"))
		{
			const auto stop = ReadElement<string>(pt, "stop_time");
			const auto step = ReadElement<string>(pt, "step");

			if (!stop || !step)
			{
				throw invalid_argument("start_time requires stop_time and step");
			}

			const time_duration stepLength(step.get());
			const time_duration last(stop.get());

			if (stepLength <= time_duration(kMinuteResolution, 0))
			{
				throw invalid_argument("step must be positive");
			}

			conf.ForecastStep(stepLength);

			for (time_duration cur(start.get()); cur <= last; cur += stepLength)
			{
				steps.push_back(cur);
			}
		}
	}
	catch (const exception& e)
	{
		throw runtime_error(fmt::format("Error parsing time information: {}", e.what()));
	}

	return steps;
}

void ReadTimes(const ptree& pt, configuration& conf)
{
	auto originTimes = ReadOriginTimes(pt);
	auto steps = ReadSteps(pt, conf);

	if (!originTimes.empty())
	{
		conf.OriginDateTimes(originTimes);

		if (steps.empty())
		{
			// new origin time keeps the steps of the enclosing scope
			for (const auto& ftime : conf.Times())
			{
				if (find(steps.begin(), steps.end(), ftime.Step()) == steps.end())
				{
					steps.push_back(ftime.Step());
				}
			}
		}
	}
	else
	{
		originTimes = conf.OriginDateTimes();
	}

	if (steps.empty())
	{
		return;
	}

	if (originTimes.empty())
	{
		throw runtime_error("Forecast steps given but origin time is missing");
	}

	vector<forecast_time> times;

	for (const auto& origin : originTimes)
	{
		for (const auto& step : steps)
		{
			times.push_back(forecast_time(origin, step));
		}
	}

	conf.Times(times);
}

// Keys that can be given at any scope

void ReadCommonOptions(const ptree& pt, configuration& conf)
{
	ReadTimes(pt, conf);
	ReadForecastTypes(pt, conf);
	ReadLevels(pt, conf);
	ReadThreadCount(pt, conf);
}

shared_ptr<plugin_configuration> ReadPlugin(const configuration& global, const ptree& queueElement,
                                            const ptree& plugin)
{
	if (plugin.empty())
	{
		throw runtime_error("json_parser: plugin definition is empty");
	}

	auto pc = make_shared<plugin_configuration>(global);

	// processqueue element overrides global scope, plugin element overrides both

	ReadCommonOptions(queueElement, *pc);
	ReadCommonOptions(plugin, *pc);

	for (const auto& kv : plugin)
	{
		if (kv.second.empty())
		{
			const string value = kv.second.get_value<string>();

			if (kv.first == "name")
			{
				pc->Name(value);
			}
			else
			{
				pc->AddOption(kv.first, value);
			}

			continue;
		}

		for (const auto& listValue : kv.second)
		{
			pc->AddOption(kv.first, listValue.second.get_value<string>());
		}
	}

	if (pc->Name().empty())
	{
		throw runtime_error("json_parser: plugin name not found from configuration");
	}

	return pc;
}
}  // namespace

vector<shared_ptr<plugin_configuration>> json_parser::Parse(shared_ptr<configuration> conf)
{
	if (conf->ConfigurationFileContent().empty())
	{
		throw runtime_error("Configuration file content not defined");
	}

	const auto plugins = ParseConfigurationFile(conf);

	if (plugins.empty())
	{
		throw runtime_error("Empty processqueue");
	}

	return plugins;
}

vector<shared_ptr<plugin_configuration>> json_parser::ParseConfigurationFile(shared_ptr<configuration> conf)
{
	logger log("json_parser");
	log.Trace(fmt::format("Parsing configuration file '{}'", conf->ConfigurationFileName()));

	ptree pt;

	try
	{
		std::istringstream in(conf->ConfigurationFileContent());
		boost::property_tree::read_json(in, pt);
	}
	catch (const exception& e)
	{
		throw runtime_error(fmt::format("Error reading configuration file: {}", e.what()));
	}

	// debug_level is global only
	ReadDebugState(pt);
	ReadCommonOptions(pt, *conf);

	const auto queue = pt.get_child_optional("processqueue");

	if (!queue || queue->empty())
	{
		throw runtime_error(ClassName() + ": processqueue missing");
	}

	vector<shared_ptr<plugin_configuration>> ret;

	for (const auto& element : queue.get())
	{
		const auto plugins = element.second.get_child_optional("plugins");

		if (!plugins || plugins->empty())
		{
			throw runtime_error(ClassName() + ": plugin definitions not found");
		}

		for (const auto& plugin : plugins.get())
		{
			ret.push_back(ReadPlugin(*conf, element.second, plugin.second));
		}
	}

	log.Debug(fmt::format("{} plugin configurations read", ret.size()));

	return ret;
}
