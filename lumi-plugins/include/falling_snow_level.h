/**
 * @file falling_snow_level.h
 *
 * @brief Plugin to calculate the height above sea level where falling
 * precipitation changes between rain and snow.
 *
 * The height is where the vertically integrated wet-bulb temperature crosses
 * a threshold. Grid points without a crossing are filled by a sequence of
 * fallbacks (profile too warm, cold sea point, horizontal neighbours).
 */

#ifndef FALLING_SNOW_LEVEL_H
#define FALLING_SNOW_LEVEL_H

#include "lumi_plugin.h"
#include "compiled_plugin_base.h"
#include "profile_provider.h"

namespace lumi
{
namespace plugin
{
/**
 * @brief Which profile value decides whether an unresolved sea point is cold
 */

enum class SeaPointProfileValue
{
	kTop = 0,  // value at the highest level
	kMax       // maximum value of the column
};

class falling_snow_level : public compiled_plugin, private compiled_plugin_base
{
   public:
	falling_snow_level();

	inline virtual ~falling_snow_level() = default;

	falling_snow_level(const falling_snow_level& other) = delete;
	falling_snow_level& operator=(const falling_snow_level& other) = delete;

	virtual void Process(std::shared_ptr<const plugin_configuration> conf) override;

	virtual std::string ClassName() const override
	{
		return "lumi::plugin::falling_snow_level";
	}
	virtual LPPluginClass PluginClass() const override
	{
		return kCompiled;
	}

	/**
	 * @brief Set the source of input fields. Must be set before Process().
	 */

	void Provider(std::shared_ptr<const profile_provider> theProvider);

	/**
	 * @return Results of the latest Process(), one field for each forecast type and
	 * time combination, forecast type being the outer dimension
	 */

	const std::vector<std::shared_ptr<info<double>>>& Results() const;

	double Threshold() const;
	double Precision() const;

	std::ostream& Write(std::ostream& file) const;

   private:
	virtual void Calculate(std::shared_ptr<info<double>> myTargetInfo, unsigned short threadIndex) override;

	void ReadOptions();

	std::shared_ptr<const profile_provider> itsProvider;

	double itsThreshold;
	double itsPrecision;
	SeaPointProfileValue itsSeaPointProfileValue;

	param itsProfileParam;
	param itsOrographyParam;
	param itsLandSeaParam;

	std::vector<level> itsProfileLevels;
};

inline std::ostream& operator<<(std::ostream& file, const falling_snow_level& ob)
{
	return ob.Write(file);
}

}  // namespace plugin
}  // namespace lumi

#endif /* FALLING_SNOW_LEVEL_H */
