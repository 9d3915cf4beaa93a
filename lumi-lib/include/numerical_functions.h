/**
 * @file numerical_functions.h
 *
 * @brief Grid stencils and interpolation
 */

#ifndef NUMERICAL_FUNCTIONS_H
#define NUMERICAL_FUNCTIONS_H

#include "lumi_common.h"
#include "matrix.h"
#include <cmath>

namespace lumi
{
namespace numerical_functions
{
/**
 * @brief Weighted mean of A over the window given by kernel B
 *
 * B is both the window and the weights. A boxed mean has all elements of B set
 * to 1; setting an element to missing excludes that position, for example the
 * centre point. Missing values of A do not contribute. If nothing contributes,
 * the result is missing.
 *
 * Only interior points, where the whole kernel fits inside A, are computed.
 * Others are missing.
 */

template <typename T>
matrix<T> Mean2D(const matrix<T>& A, const matrix<T>& B);

/**
 * @brief Generic windowed reduction of A with kernel B
 *
 * For every interior point, f(value, weight, a, b) is called once per kernel
 * element starting from value=init1 and weight=init2, and the result is
 * g(value, weight). The kernel is applied flipped, as in a convolution.
 */

template <typename T, class F, class G>
matrix<T> Reduce2D(const matrix<T>& A, const matrix<T>& B, F&& f, G&& g, T init1, T init2);

namespace interpolation
{
/// @brief Value at fraction factor of the way from Y1 to Y2
template <typename Type>
inline Type Linear(Type factor, Type Y1, Type Y2)
{
	return std::fma(factor, Y2 - Y1, Y1);
}

/**
 * @brief Interpolate Y at X linearly between (X1, Y1) and (X2, Y2)
 *
 * If X1 equals X2, Y1 is returned.
 */

template <typename Type>
inline Type Linear(Type X, Type X1, Type X2, Type Y1, Type Y2)
{
	if (X1 == X2)
	{
		return Y1;
	}

	return Linear<Type>((X - X1) / (X2 - X1), Y1, Y2);
}

}  // namespace interpolation

}  // namespace numerical_functions

}  // namespace lumi

#include "numerical_functions_impl.h"

#endif /* NUMERICAL_FUNCTIONS_H */
