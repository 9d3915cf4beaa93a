namespace lumi
{
namespace numerical_functions
{
template <typename T, class F, class G>
matrix<T> Reduce2D(const matrix<T>& A, const matrix<T>& B, F&& f, G&& g, T init1, T init2)
{
	matrix<T> ret(A.SizeX(), A.SizeY(), 1, A.MissingValue());

	const size_t halfX = B.SizeX() / 2;
	const size_t halfY = B.SizeY() / 2;

	for (size_t y = halfY; y + halfY < A.SizeY(); ++y)
	{
		for (size_t x = halfX; x + halfX < A.SizeX(); ++x)
		{
			T value = init1;
			T weight = init2;

			for (size_t ky = 0; ky < B.SizeY(); ++ky)
			{
				for (size_t kx = 0; kx < B.SizeX(); ++kx)
				{
					f(value, weight, A.At(x + kx - halfX, y + ky - halfY, 0),
					  B.At(B.SizeX() - 1 - kx, B.SizeY() - 1 - ky, 0));
				}
			}

			ret[ret.Index(x, y, 0)] = g(value, weight);
		}
	}

	return ret;
}

template <typename T>
matrix<T> Mean2D(const matrix<T>& A, const matrix<T>& B)
{
	const auto accumulate = [](T& sum, T& weights, const T& a, const T& b)
	{
		if (IsValid(a) && IsValid(b))
		{
			sum += a * b;
			weights += b;
		}
	};

	const auto mean = [](const T& sum, const T& weights) { return weights == T(0) ? MissingValue<T>() : sum / weights; };

	return Reduce2D(A, B, accumulate, mean, T(0), T(0));
}

}  // namespace numerical_functions
}  // namespace lumi
