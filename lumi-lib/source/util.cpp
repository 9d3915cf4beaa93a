/**
 * @file util.cpp
 *
 */

#include "util.h"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fmt/format.h>
#include <stdexcept>

using namespace lumi;
using namespace std;

namespace
{
template <typename T>
T Convert(const string& str)
{
	try
	{
		return boost::lexical_cast<T>(str);
	}
	catch (const boost::bad_lexical_cast&)
	{
		throw invalid_argument(fmt::format("Unable to convert '{}' to a number", str));
	}
}

template <>
string Convert<string>(const string& str)
{
	return str;
}

void AppendRange(vector<int>& ret, int first, int last, int step)
{
	if (first <= last)
	{
		for (int v = first; v <= last; v += step)
		{
			ret.push_back(v);
		}
	}
	else
	{
		for (int v = first; v >= last; v -= step)
		{
			ret.push_back(v);
		}
	}
}

// "pf3" or "pf1-10"

void AppendPerturbations(vector<forecast_type>& ret, const string& token)
{
	const auto members = util::Split<int>(token.substr(2), "-");

	if (members.empty() || members.size() > 2)
	{
		throw invalid_argument(fmt::format("Invalid forecast type specifier: {}", token));
	}

	for (int member = members.front(); member <= members.back(); member++)
	{
		ret.push_back(forecast_type(kEpsPerturbation, member));
	}
}
}  // namespace

template <typename T>
vector<T> util::Split(const string& s, const string& delims)
{
	vector<string> tokens;
	boost::split(tokens, s, boost::is_any_of(delims));

	vector<T> ret;
	ret.reserve(tokens.size());

	for (const auto& token : tokens)
	{
		ret.push_back(Convert<T>(boost::algorithm::trim_copy(token)));
	}

	return ret;
}

template vector<string> util::Split<string>(const string&, const string&);
template vector<double> util::Split<double>(const string&, const string&);
template vector<int> util::Split<int>(const string&, const string&);

vector<string> util::Split(const string& s, const string& delims)
{
	return Split<string>(s, delims);
}

vector<int> util::ExpandString(const string& identifier)
{
	vector<int> ret;

	for (const auto& token : Split(identifier, ","))
	{
		const auto parts = Split<int>(token, "-");

		switch (parts.size())
		{
			case 1:
				ret.push_back(parts[0]);
				break;
			case 2:
				AppendRange(ret, parts[0], parts[1], 1);
				break;
			case 3:
				if (parts[2] <= 0)
				{
					throw invalid_argument(fmt::format("Invalid step in '{}'", token));
				}
				AppendRange(ret, parts[0], parts[1], parts[2]);
				break;
			default:
				throw invalid_argument(fmt::format("Invalid range definition: '{}'", token));
		}
	}

	return ret;
}

vector<forecast_type> util::ForecastTypesFromString(const string& types)
{
	vector<forecast_type> ret;

	for (const auto& token : Split(boost::algorithm::to_lower_copy(types), ","))
	{
		if (boost::algorithm::starts_with(token, "pf"))
		{
			AppendPerturbations(ret, token);
		}
		else if (boost::algorithm::starts_with(token, "cf"))
		{
			ret.push_back(forecast_type(kEpsControl, token.size() > 2 ? Convert<int>(token.substr(2)) : 0));
		}
		else if (token == "det" || token == "deterministic")
		{
			ret.push_back(forecast_type(kDeterministic));
		}
		else if (token == "an" || token == "analysis")
		{
			ret.push_back(forecast_type(kAnalysis));
		}
		else
		{
			throw invalid_argument(fmt::format("Invalid forecast type specifier: {}", token));
		}
	}

	return ret;
}
