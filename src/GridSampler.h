/**
 * @file GridSampler.h
 *
 *  Created on: 24.11.2021
 *      Author: andre
 */

#ifndef GRIDSAMPLER_H_
#define GRIDSAMPLER_H_

#include "BitMatrix.h"
#include <algorithm>

/**
 * Reads the color of a single cell.
 * Instead of relying on one pixel, a small area around the center votes for the color.
 */
class GridSampler
{
  public:
	/// Largest distance from the center which is still sampled
	static constexpr int kMaxSampleRadius = 2;

	/// A cell is black if at least this percentage of sampled pixels is black.
	/// Lower than 50 to still detect faded black cells.
	static constexpr int kBlackPercentage = 40;

	/**
	 * @param image		Monochrome image
	 * @param centerX	X position of the center of the cell
	 * @param centerY	Y position of the center of the cell
	 * @param cellSize	Approximate size of a cell in pixels
	 * @return			true for a black cell
	 */
	static bool sample(const BitMatrix& image, int centerX, int centerY, int cellSize)
	{
		if (cellSize <= 1)
			return image.get(centerX, centerY);

		int radius		 = std::min(kMaxSampleRadius, cellSize / 2);
		int black_pixels = 0;
		int total_pixels = 0;

		for (int y = centerY - radius; y <= centerY + radius; y++)
		{
			if (y < 0 || y >= image.getHeight())
				continue;

			for (int x = centerX - radius; x <= centerX + radius; x++)
			{
				if (x < 0 || x >= image.getWidth())
					continue;

				if (image.get(x, y))
					black_pixels++;
				total_pixels++;
			}
		}

		return black_pixels * 100 >= total_pixels * kBlackPercentage;
	}
};

#endif /* GRIDSAMPLER_H_ */
