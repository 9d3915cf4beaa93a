/**
 *
 * @file compiled_plugin_base.cpp
 *
 */

#include "compiled_plugin_base.h"
#include "logger.h"
#include <algorithm>
#include <thread>

using namespace std;
using namespace lumi;
using namespace lumi::plugin;

bool compiled_plugin_base::Next(size_t& sliceIndex)
{
	lock_guard<mutex> lock(itsSliceMutex);

	if (itsNextSlice >= itsSlices.size())
	{
		return false;
	}

	sliceIndex = itsNextSlice++;
	return true;
}

void compiled_plugin_base::SetParams(const param& theParam, const level& theLevel)
{
	itsTargetParam = theParam;
	itsTargetLevel = theLevel;
}

void compiled_plugin_base::SetThreadCount()
{
	const short configured = itsConfiguration->ThreadCount();

	itsThreadCount = (configured > 0) ? configured : static_cast<short>(min<size_t>(12, itsSlices.size()));
}

void compiled_plugin_base::Start()
{
	if (!itsPluginIsInitialized)
	{
		itsBaseLogger.Error("Start() called before Init()");
		return;
	}

	// From the timing perspective at this point plugin initialization is done

	itsTimer.Stop();
	itsBaseLogger.Trace(fmt::format("Initialization took {} ms", itsTimer.GetTime()));
	itsTimer.Start();

	itsResults.clear();
	itsResults.reserve(itsSlices.size());

	for (const auto& slice : itsSlices)
	{
		itsResults.push_back(make_shared<info<double>>(slice.first, slice.second, itsTargetLevel, itsTargetParam));
	}

	itsNextSlice = 0;
	itsFirstError = nullptr;

	SetThreadCount();

	vector<thread> threads;

	for (short i = 0; i < itsThreadCount; i++)
	{
		itsBaseLogger.Info("Thread " + to_string(i) + " starting");
		threads.emplace_back(thread(&compiled_plugin_base::Run, this, static_cast<unsigned short>(i + 1)));
	}

	for (auto& t : threads)
	{
		t.join();
	}

	Finish();

	if (itsFirstError)
	{
		rethrow_exception(itsFirstError);
	}
}

void compiled_plugin_base::Init(const shared_ptr<const plugin_configuration> conf)
{
	itsConfiguration = conf;

	itsTimer.Start();

	itsSlices.clear();
	itsResults.clear();

	for (const auto& ftype : itsConfiguration->ForecastTypes())
	{
		for (const auto& ftime : itsConfiguration->Times())
		{
			itsSlices.emplace_back(ftype, ftime);
		}
	}

	itsPluginIsInitialized = true;
}

void compiled_plugin_base::Run(unsigned short threadIndex)
{
	size_t sliceIndex;

	while (Next(sliceIndex))
	{
		auto myTargetInfo = itsResults[sliceIndex];

		try
		{
			Calculate(myTargetInfo, threadIndex);
		}
		catch (const exception& e)
		{
			itsBaseLogger.Error(fmt::format("Slice {} failed: {}", sliceIndex, e.what()));

			lock_guard<mutex> lock(itsSliceMutex);

			if (!itsFirstError)
			{
				itsFirstError = current_exception();
			}
		}
	}
}

void compiled_plugin_base::Finish()
{
	itsTimer.Stop();
	itsBaseLogger.Debug(fmt::format("Processing {} slices with {} threads took {} ms", itsSlices.size(),
	                                itsThreadCount, itsTimer.GetTime()));
}

const vector<shared_ptr<info<double>>>& compiled_plugin_base::Results() const
{
	return itsResults;
}
