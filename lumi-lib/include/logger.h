/**
 * @file logger.h
 *
 * @brief Named, level-filtered logger. Every plugin and thread creates its
 * own instance; the level defaults to logger::MainDebugState.
 *
 * Messages go to stdout as "Level::name message".
 */

#ifndef LOGGER_H
#define LOGGER_H

#include "lumi_common.h"
#include <fmt/format.h>

namespace lumi
{
class logger
{
   public:
	logger() : logger("LumiDefaultLogger")
	{
	}
	explicit logger(const std::string& theUserName) : logger(theUserName, MainDebugState)
	{
	}
	logger(const std::string& theUserName, LPDebugState theDebugState)
	    : itsDebugState(theDebugState), itsUserName(theUserName)
	{
	}

	void Trace(const std::string& msg) const
	{
		Print(kTraceMsg, "Trace", msg);
	}
	void Debug(const std::string& msg) const
	{
		Print(kDebugMsg, "Debug", msg);
	}
	void Info(const std::string& msg) const
	{
		Print(kInfoMsg, "Info", msg);
	}
	void Warning(const std::string& msg) const
	{
		Print(kWarningMsg, "Warning", msg);
	}
	void Error(const std::string& msg) const
	{
		Print(kErrorMsg, "Error", msg);
	}

	// Fatal is never filtered
	void Fatal(const std::string& msg) const
	{
		Print(itsDebugState, "Fatal", msg);
	}

	LPDebugState DebugState() const
	{
		return itsDebugState;
	}
	const std::string& UserName() const
	{
		return itsUserName;
	}

	static LPDebugState MainDebugState;

   private:
	void Print(LPDebugState theLevel, const char* theLabel, const std::string& msg) const;

	LPDebugState itsDebugState;
	std::string itsUserName;
};

}  // namespace lumi

#endif /* LOGGER_H */
