/**
 * @file debug.h
 *
 * @brief ASSERT for programming errors. Compiled in only when DEBUG is defined.
 *
 * A failed assertion prints the expression and a backtrace. Under a debugger
 * execution stops at a breakpoint, otherwise the program aborts.
 */

#ifndef LUMI_DEBUG_H
#define LUMI_DEBUG_H

#ifdef DEBUG
#define ASSERT(Expr)                                                                  \
	do                                                                                \
	{                                                                                 \
		if (!(Expr))                                                                  \
		{                                                                             \
			if (lumi::AssertionFailed(#Expr, __LINE__, __FUNCTION__, __FILE__))       \
			{                                                                         \
				__asm__ __volatile__("int $3");                                       \
			}                                                                         \
			else                                                                      \
			{                                                                         \
				lumi::Abort();                                                        \
			}                                                                         \
		}                                                                             \
	} while (false)
#else
#define ASSERT(Expr)
#endif

namespace lumi
{
/// @return True if a debugger is attached
bool AssertionFailed(const char* expr, long line, const char* fn, const char* file);

void Abort() __attribute__((noreturn));
}  // namespace lumi

#endif /* LUMI_DEBUG_H */
