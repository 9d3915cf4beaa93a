/**
 * @file level.h
 *
 * @brief Vertical level of a field: level type and value.
 *
 * For height levels the value is metres above ground.
 */

#ifndef LEVEL_H
#define LEVEL_H

#include "lumi_common.h"
#include <fmt/format.h>

namespace lumi
{
enum LPLevelType
{
	kUnknownLevel = 0,
	kGround = 1,
	kMeanSea = 102,
	kAltitude = 103,
	kHeight = 105
};

const boost::unordered_map<LPLevelType, std::string> LPLevelTypeToString =
    ba::map_list_of(kUnknownLevel, "unknown")(kGround, "ground")(kMeanSea, "meansea")(kAltitude, "altitude")(
        kHeight, "height");

const boost::unordered_map<std::string, LPLevelType> LPStringToLevelType =
    ba::map_list_of("unknown", kUnknownLevel)("ground", kGround)("meansea", kMeanSea)("altitude", kAltitude)(
        "height", kHeight);

class level
{
   public:
	level() = default;
	level(LPLevelType theType, double theValue) : itsType(theType), itsValue(theValue)
	{
	}

	std::string ClassName() const
	{
		return "lumi::level";
	}

	LPLevelType Type() const
	{
		return itsType;
	}
	double Value() const
	{
		return itsValue;
	}

	bool operator==(const level& other) const
	{
		return itsType == other.itsType && itsValue == other.itsValue;
	}
	bool operator!=(const level& other) const
	{
		return !(*this == other);
	}

	/// @brief "type/value", for example "height/200"
	operator std::string() const
	{
		return fmt::format("{}/{}", LPLevelTypeToString.at(itsType), itsValue);
	}

	std::ostream& Write(std::ostream& file) const
	{
		return file << "<" << ClassName() << "> " << static_cast<std::string>(*this) << std::endl;
	}

   private:
	LPLevelType itsType = kUnknownLevel;
	double itsValue = kLPMissingValue;
};

inline std::ostream& operator<<(std::ostream& file, const level& ob)
{
	return ob.Write(file);
}
}  // namespace lumi

template <>
struct fmt::formatter<lumi::level> : fmt::formatter<std::string>
{
	template <typename FormatContext>
	auto format(const lumi::level& l, FormatContext& ctx) const -> decltype(ctx.out())
	{
		return fmt::formatter<std::string>::format(static_cast<std::string>(l), ctx);
	}
};

#endif /* LEVEL_H */
