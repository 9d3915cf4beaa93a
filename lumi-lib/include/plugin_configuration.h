/**
 * @file plugin_configuration.h
 *
 * @brief Run-wide configuration plus the name and free-form options of one plugin.
 *
 * Options are string lists keyed by name. A key given once in the
 * configuration file has a list of one value.
 */

#ifndef PLUGIN_CONFIGURATION_H
#define PLUGIN_CONFIGURATION_H

#include "configuration.h"
#include <map>
#include <vector>

namespace lumi
{
class plugin_configuration : public configuration
{
   public:
	typedef std::map<std::string, std::vector<std::string>> options_t;

	plugin_configuration() = default;
	plugin_configuration(const plugin_configuration& other) = default;
	plugin_configuration& operator=(const plugin_configuration& other) = delete;

	explicit plugin_configuration(const configuration& theConfiguration) : configuration(theConfiguration)
	{
	}
	plugin_configuration(const std::string& theName, const options_t& theOptions)
	    : itsName(theName), itsOptions(theOptions)
	{
	}

	std::string ClassName() const
	{
		return "lumi::plugin_configuration";
	}
	std::ostream& Write(std::ostream& file) const;

	const std::string& Name() const
	{
		return itsName;
	}
	void Name(const std::string& theName)
	{
		itsName = theName;
	}

	/**
	 * @brief Append a value to key, creating the key if needed
	 */

	void AddOption(const std::string& key, const std::string& value)
	{
		itsOptions[key].push_back(value);
	}

	bool Exists(const std::string& key) const
	{
		return itsOptions.count(key) > 0;
	}

	/**
	 * @brief Single value of a key
	 *
	 * @return Empty string if key doesn't exist. Throws std::runtime_error if key has several values.
	 */

	std::string GetValue(const std::string& key) const;

	/**
	 * @brief All values of a key, throws std::out_of_range if key doesn't exist
	 */

	const std::vector<std::string>& GetValueList(const std::string& key) const
	{
		return itsOptions.at(key);
	}

   private:
	std::string itsName;
	options_t itsOptions;
};

inline std::ostream& operator<<(std::ostream& file, const plugin_configuration& ob)
{
	return ob.Write(file);
}
}  // namespace lumi

#endif /* PLUGIN_CONFIGURATION_H */
