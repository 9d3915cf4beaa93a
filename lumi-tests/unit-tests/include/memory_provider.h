#ifndef MEMORY_PROVIDER_H
#define MEMORY_PROVIDER_H

#include "profile_provider.h"
#include <map>
#include <mutex>

/**
 * @brief profile_provider that serves fields from memory
 *
 * Fields added with AddStatic() are returned for every forecast time and type.
 */

class memory_provider : public lumi::plugin::profile_provider
{
   public:
	memory_provider() = default;

	std::string ClassName() const override
	{
		return "memory_provider";
	}

	void Add(const lumi::forecast_type& ftype, const lumi::forecast_time& ftime, const lumi::level& lev,
	         const lumi::param& par, size_t sizeX, size_t sizeY, const std::vector<double>& values)
	{
		auto i = std::make_shared<lumi::info<double>>(ftype, ftime, lev, par);
		i->Create(sizeX, sizeY, values);
		itsFields[Key(ftype, ftime, lev, par)] = i;
	}

	void AddStatic(const lumi::level& lev, const lumi::param& par, size_t sizeX, size_t sizeY,
	               const std::vector<double>& values)
	{
		auto i = std::make_shared<lumi::info<double>>(lumi::forecast_type(), lumi::forecast_time(), lev, par);
		i->Create(sizeX, sizeY, values);
		itsStaticFields[StaticKey(lev, par)] = i;
	}

	std::shared_ptr<lumi::info<double>> Fetch(const lumi::forecast_time& ftime, const lumi::level& lev,
	                                          const lumi::param& par, const lumi::forecast_type& ftype) const override
	{
		{
			std::lock_guard<std::mutex> lock(itsCountMutex);
			itsFetchCount++;
		}

		auto iter = itsFields.find(Key(ftype, ftime, lev, par));

		if (iter != itsFields.end())
		{
			return iter->second;
		}

		auto siter = itsStaticFields.find(StaticKey(lev, par));

		if (siter != itsStaticFields.end())
		{
			return siter->second;
		}

		return nullptr;
	}

	size_t FetchCount() const
	{
		std::lock_guard<std::mutex> lock(itsCountMutex);
		return itsFetchCount;
	}

   private:
	static std::string Key(const lumi::forecast_type& ftype, const lumi::forecast_time& ftime, const lumi::level& lev,
	                       const lumi::param& par)
	{
		return fmt::format("{}/{}/{}/{}", ftype, ftime.ValidDateTime(), lev, par.Name());
	}

	static std::string StaticKey(const lumi::level& lev, const lumi::param& par)
	{
		return fmt::format("{}/{}", lev, par.Name());
	}

	std::map<std::string, std::shared_ptr<lumi::info<double>>> itsFields;
	std::map<std::string, std::shared_ptr<lumi::info<double>>> itsStaticFields;

	mutable std::mutex itsCountMutex;
	mutable size_t itsFetchCount = 0;
};

#endif /* MEMORY_PROVIDER_H */
