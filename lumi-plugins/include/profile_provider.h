/**
 * @file profile_provider.h
 *
 * @brief Interface for auxiliary plugins that hand source fields to compiled plugins.
 *
 * Fetch() is called concurrently from the worker threads of a compiled plugin,
 * so implementations must be safe for concurrent reads.
 *
 * Missing grid values can be given as MissingDouble() or as any other nan.
 */

#ifndef PROFILE_PROVIDER_H
#define PROFILE_PROVIDER_H

#include "info.h"
#include "lumi_plugin.h"

namespace lumi
{
namespace plugin
{
class profile_provider : public lumi_plugin
{
   public:
	profile_provider() = default;
	virtual ~profile_provider() = default;

	profile_provider(const profile_provider& other) = delete;
	profile_provider& operator=(const profile_provider& other) = delete;

	virtual std::string ClassName() const override
	{
		return "lumi::plugin::profile_provider";
	}

	virtual LPPluginClass PluginClass() const override
	{
		return kAuxiliary;
	}

	/**
	 * @brief Fetch one field with given metadata
	 *
	 * @return Field on success, null pointer if data is not found
	 */

	virtual std::shared_ptr<info<double>> Fetch(const forecast_time& requestedTime, const level& requestedLevel,
	                                            const param& requestedParam,
	                                            const forecast_type& requestedType) const = 0;
};

}  // namespace plugin
}  // namespace lumi

#endif /* PROFILE_PROVIDER_H */
