/**
 * @file lumi_plugin.h
 *
 * @brief Plugin interfaces. Compiled plugins produce fields from a
 * configuration, auxiliary plugins serve other plugins.
 *
 */

#ifndef LUMI_PLUGIN_H
#define LUMI_PLUGIN_H

#include "logger.h"
#include "plugin_configuration.h"
#include <memory>

namespace lumi
{
namespace plugin
{
class lumi_plugin
{
   public:
	virtual ~lumi_plugin() = default;

	virtual std::string ClassName() const = 0;
	virtual LPPluginClass PluginClass() const = 0;

   protected:
	logger itsLogger;
};

class compiled_plugin : public lumi_plugin
{
   public:
	/**
	 * @brief Run the plugin for every time and forecast type of the configuration
	 */

	virtual void Process(std::shared_ptr<const plugin_configuration> conf) = 0;
};

}  // namespace plugin
}  // namespace lumi

#endif /* LUMI_PLUGIN_H */
