/**
 * @file param.h
 *
 * Parameter identity of a field: the name a provider knows it by, and the
 * physical unit.
 *
 */

#ifndef PARAM_H
#define PARAM_H

#include "lumi_common.h"
#include <fmt/format.h>
#include <vector>

namespace lumi
{
class param
{
   public:
	param() = default;
	explicit param(const std::string& theName, LPParameterUnit theUnit = kUnknownUnit)
	    : itsName(theName), itsUnit(theUnit)
	{
	}

	std::string ClassName() const
	{
		return "lumi::param";
	}

	const std::string& Name() const
	{
		return itsName;
	}
	LPParameterUnit Unit() const
	{
		return itsUnit;
	}

	bool operator==(const param& other) const
	{
		return itsName == other.itsName && itsUnit == other.itsUnit;
	}
	bool operator!=(const param& other) const
	{
		return !(*this == other);
	}

	std::ostream& Write(std::ostream& file) const
	{
		return file << "<" << ClassName() << "> " << itsName << " [" << LPParameterUnitToString.at(itsUnit) << "]"
		            << std::endl;
	}

   private:
	std::string itsName = "XX-X";
	LPParameterUnit itsUnit = kUnknownUnit;
};

inline std::ostream& operator<<(std::ostream& file, const param& ob)
{
	return ob.Write(file);
}
typedef std::vector<lumi::param> params;

}  // namespace lumi

template <>
struct fmt::formatter<lumi::param> : fmt::formatter<std::string>
{
	template <typename FormatContext>
	auto format(const lumi::param& p, FormatContext& ctx) const -> decltype(ctx.out())
	{
		return fmt::formatter<std::string>::format(p.Name(), ctx);
	}
};

#endif /* PARAM_H */
