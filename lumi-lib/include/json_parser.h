/**
 * @file json_parser.h
 *
 */

#ifndef JSON_PARSER_H
#define JSON_PARSER_H

#include "plugin_configuration.h"
#include <memory>
#include <vector>

namespace lumi
{
/**
 * @class json_parser
 *
 * @brief Reads a JSON run configuration
 *
 * Layout:
 *
 * {
 *   <global options>,
 *   "processqueue" : [
 *     { <options>, "plugins" : [ { "name" : "...", <options> }, ... ] },
 *     ...
 *   ]
 * }
 *
 * Times, forecast types, levels and thread count can be given at any scope;
 * the innermost one wins. debug_level is read from the global scope only.
 * Other keys of a plugin element become its options.
 */

class json_parser
{
   public:
	json_parser() = default;
	json_parser(const json_parser& other) = delete;
	json_parser& operator=(const json_parser& other) = delete;

	std::string ClassName() const
	{
		return "lumi::json_parser";
	}

	/**
	 * @brief Create a configuration for each plugin of conf's ConfigurationFileContent()
	 *
	 * Global options are written to conf.
	 *
	 * @throws std::runtime_error if content cannot be parsed, or processqueue is missing or empty
	 */

	std::vector<std::shared_ptr<plugin_configuration>> Parse(std::shared_ptr<configuration> conf);

   private:
	std::vector<std::shared_ptr<plugin_configuration>> ParseConfigurationFile(std::shared_ptr<configuration> conf);
};

}  // namespace lumi

#endif /* JSON_PARSER_H */
