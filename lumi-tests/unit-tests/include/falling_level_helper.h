#ifndef FALLING_LEVEL_HELPER_H
#define FALLING_LEVEL_HELPER_H

#include "matrix.h"
#include <iostream>

// Grid from rows, first row is y = 0
static lumi::matrix<double> Grid(const std::vector<std::vector<double>>& rows)
{
	const size_t sizeY = rows.size();
	const size_t sizeX = rows[0].size();

	std::vector<double> values;

	for (const auto& row : rows)
	{
		values.insert(values.end(), row.begin(), row.end());
	}

	return lumi::matrix<double>(sizeX, sizeY, 1, lumi::MissingDouble(), values);
}

static void Dump(const lumi::matrix<double>& m)
{
	for (size_t j = 0; j < m.SizeY(); ++j)
	{
		for (size_t i = 0; i < m.SizeX(); ++i)
		{
			std::cout << m.At(i, j, 0) << " ";
		}
		std::cout << std::endl;
	}
}

#endif /* FALLING_LEVEL_HELPER_H */
