/**
 * @file timer.h
 *
 * @brief Wall clock stopwatch with millisecond output
 */

#ifndef TIMER_H
#define TIMER_H

#include <chrono>
#include <stdint.h>

namespace lumi
{
class timer
{
   public:
	timer() = default;
	explicit timer(bool start)
	{
		if (start)
		{
			Start();
		}
	}

	void Start()
	{
		itsStart = std::chrono::steady_clock::now();
		itsStop = itsStart;
	}
	void Stop()
	{
		itsStop = std::chrono::steady_clock::now();
	}

	/**
	 * @return Milliseconds between last Start() and Stop()
	 */

	int64_t GetTime() const
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(itsStop - itsStart).count();
	}

   private:
	std::chrono::steady_clock::time_point itsStart;
	std::chrono::steady_clock::time_point itsStop;
};

}  // namespace lumi

#endif /* TIMER_H */
