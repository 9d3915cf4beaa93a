/**
 * @file compiled_plugin_base.h
 *
 */

#ifndef COMPILED_PLUGIN_BASE_H
#define COMPILED_PLUGIN_BASE_H

#include "info.h"
#include "lumi_plugin.h"
#include "timer.h"
#include <exception>
#include <mutex>

namespace lumi
{
namespace plugin
{
/**
 * @class compiled_plugin_base
 *
 * @brief Runs a plugin's Calculate() over all slices with a pool of threads
 *
 * A slice is one forecast type and forecast time. Every slice gets its own
 * result field, and threads take whole slices in turn. Results() lists the
 * fields forecast type by forecast type, times in configuration order.
 */

class compiled_plugin_base
{
   public:
	compiled_plugin_base() = default;
	virtual ~compiled_plugin_base() = default;
	compiled_plugin_base(const compiled_plugin_base& other) = delete;
	compiled_plugin_base& operator=(const compiled_plugin_base& other) = delete;

   protected:
	virtual std::string ClassName() const
	{
		return "lumi::plugin::compiled_plugin_base";
	}

	/**
	 * @brief Build the slice list from conf, discarding earlier results
	 */

	virtual void Init(const std::shared_ptr<const plugin_configuration> conf);

	/// @brief Metadata given to every result field
	void SetParams(const param& theParam, const level& theLevel);

	/**
	 * @brief Process all slices and wait for the threads to finish
	 *
	 * If Calculate() threw for any slice, the first exception is rethrown here.
	 * Other slices are still processed.
	 */

	virtual void Start();

	/**
	 * @brief Fill one result field
	 *
	 * @param myTargetInfo Result of the slice, metadata set but data not created
	 * @param threadIndex 1-based index of the calling thread
	 */

	virtual void Calculate(std::shared_ptr<info<double>> myTargetInfo, unsigned short threadIndex) = 0;

	virtual void Finish();

	const std::vector<std::shared_ptr<info<double>>>& Results() const;

	std::shared_ptr<const plugin_configuration> itsConfiguration;
	timer itsTimer;
	short itsThreadCount = -1;

   private:
	bool Next(size_t& sliceIndex);
	void Run(unsigned short threadIndex);

	// -1 in configuration means one thread per slice, at most 12
	void SetThreadCount();

	logger itsBaseLogger = logger("compiled_plugin_base");
	bool itsPluginIsInitialized = false;

	param itsTargetParam;
	level itsTargetLevel;

	std::vector<std::pair<forecast_type, forecast_time>> itsSlices;
	std::vector<std::shared_ptr<info<double>>> itsResults;
	size_t itsNextSlice = 0;

	std::mutex itsSliceMutex;
	std::exception_ptr itsFirstError;
};

}  // namespace plugin
}  // namespace lumi

#endif /* COMPILED_PLUGIN_BASE_H */
