/*
 * logger.cpp
 *
 */

#include "logger.h"

using namespace lumi;

LPDebugState logger::MainDebugState = kInfoMsg;

void logger::Print(LPDebugState theLevel, const char* theLabel, const std::string& msg) const
{
	if (theLevel >= itsDebugState)
	{
		fmt::print("{}::{} {}\n", theLabel, itsUserName, msg);
	}
}
