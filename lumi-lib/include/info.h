/**
 * @file info.h
 *
 * @brief One horizontal field together with the metadata that identifies it:
 * forecast type, forecast time, level and parameter.
 *
 * Data is a matrix of depth 1 with x as the fastest running index. A field
 * that has not been created has size 0x0.
 */

#ifndef INFO_H
#define INFO_H

#include "forecast_time.h"
#include "forecast_type.h"
#include "level.h"
#include "matrix.h"
#include "param.h"

namespace lumi
{
template <typename T>
class info
{
   public:
	info() = default;
	info(const forecast_type& ftype, const forecast_time& time, const level& lev, const param& par)
	    : itsForecastType(ftype), itsTime(time), itsLevel(lev), itsParam(par)
	{
	}

	std::string ClassName() const
	{
		return "lumi::info";
	}

	/// @brief Allocate data, all values missing
	void Create(size_t theSizeX, size_t theSizeY)
	{
		itsData = matrix<T>(theSizeX, theSizeY, 1, MissingValue<T>());
	}

	/// @brief Allocate data from values given row by row, first row is y=0
	void Create(size_t theSizeX, size_t theSizeY, const std::vector<T>& theValues)
	{
		itsData = matrix<T>(theSizeX, theSizeY, 1, MissingValue<T>(), theValues);
	}

	matrix<T>& Data()
	{
		return itsData;
	}
	const matrix<T>& Data() const
	{
		return itsData;
	}
	void Data(matrix<T> theData)
	{
		itsData = std::move(theData);
	}

	const forecast_type& ForecastType() const
	{
		return itsForecastType;
	}
	void ForecastType(const forecast_type& theForecastType)
	{
		itsForecastType = theForecastType;
	}
	const forecast_time& Time() const
	{
		return itsTime;
	}
	void Time(const forecast_time& theTime)
	{
		itsTime = theTime;
	}
	const level& Level() const
	{
		return itsLevel;
	}
	const param& Param() const
	{
		return itsParam;
	}

	size_t SizeX() const
	{
		return itsData.SizeX();
	}
	size_t SizeY() const
	{
		return itsData.SizeY();
	}

	std::ostream& Write(std::ostream& file) const
	{
		file << "<" << ClassName() << ">" << std::endl;
		file << itsForecastType << itsTime << itsLevel << itsParam << itsData;

		return file;
	}

   private:
	forecast_type itsForecastType;
	forecast_time itsTime;
	level itsLevel;
	param itsParam;

	matrix<T> itsData;
};

template <typename T>
inline std::ostream& operator<<(std::ostream& file, const info<T>& ob)
{
	return ob.Write(file);
}

template <typename T>
using info_t = std::shared_ptr<info<T>>;

}  // namespace lumi

#endif /* INFO_H */
