/**
 * @file PureBitsExtractor.h
 *
 *  Created on: 25.11.2021
 *      Author: andre
 */

#ifndef PUREBITSEXTRACTOR_H_
#define PUREBITSEXTRACTOR_H_

#include "BitMatrix.h"
#include "DecodeOutcome.h"
#include "GridSampler.h"
#include "ModuleSizeEstimator.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdio.h>

/**
 * Position and size of the grid of cells inside of an image
 */
struct GridGeometry
{
	/// X position of the center of the leftmost column of cells
	int left;
	/// Y position of the center of the topmost row of cells
	int top;
	/// Width of the code in cells
	int width;
	/// Height of the code in cells
	int height;
	/// Size of a cell in pixels
	float moduleSize;
};

/**
 * Extracts the cells of a code from an image which shows nothing else than the code itself.
 * The code must be upright and not be distorted. Small rotations and a bit of cropping or noise
 * are tolerated.
 *
 * Every parameter of the grid is derived from counting pixels. As soon as any of them
 * contradicts another one, the extraction is aborted with kNotFound instead of
 * delivering a grid which is probably wrong anyway.
 */
class PureBitsExtractor
{
  public:
	/// Width of the smallest Qr Code in cells
	static constexpr int kMinimumDimension = 21;

	/// If true, the class is more verbose
	bool debugMode{false};

	/**
	 * @param image		Monochrome image, containing only the code
	 * @return			One element per cell or kNotFound
	 */
	DecodeOutcome<BitMatrix> extract(const BitMatrix& image) const
	{
		auto geometry = locateGrid(image);
		if (!geometry)
		{
			if (debugMode)
				printf("Unable to locate grid: %s\n", geometry.error().detail().c_str());
			return geometry.error();
		}

		const GridGeometry& g = geometry.value();
		if (debugMode)
		{
			printf("moduleSize %f, grid of %d x %d cells starting at %d %d\n", g.moduleSize, g.width, g.height,
				   g.left, g.top);
		}

		return sampleGrid(image, g);
	}

	/**
	 * Finds the black area of the image and fits a grid of cells into it
	 * @param image		Monochrome image, containing only the code
	 * @return			Grid or kNotFound
	 */
	static DecodeOutcome<GridGeometry> locateGrid(const BitMatrix& image)
	{
		auto left_top_black		= image.getTopLeftOnBit();
		auto right_bottom_black = image.getBottomRightOnBit();
		if (!left_top_black || !right_bottom_black)
			return DecodeError::notFound("Image is empty");

		auto module_size = ModuleSizeEstimator::estimate(image, *left_top_black);
		if (!module_size)
			return module_size.error();

		return fitGrid(left_top_black->x, left_top_black->y, right_bottom_black->x, right_bottom_black->y,
					   module_size.value(), image.getWidth(), image.getHeight());
	}

	/**
	 * Calculates the grid of cells for a black area.
	 *
	 * @param left			X of the leftmost black pixel
	 * @param top			Y of the topmost black pixel
	 * @param right			X of the rightmost black pixel
	 * @param bottom		Y of the bottommost black pixel
	 * @param moduleSize	Size of a cell in pixels
	 * @param imageWidth	Width of the image in pixels
	 * @param imageHeight	Height of the image in pixels
	 * @return				Grid or kNotFound
	 */
	static DecodeOutcome<GridGeometry> fitGrid(int left, int top, int right, int bottom, float moduleSize,
											   int imageWidth, int imageHeight)
	{
		// A black area with no extent in one direction is extended to the size of the smallest code
		if (left >= right)
			right = std::min(imageWidth - 1, left + static_cast<int>(moduleSize * kMinimumDimension));

		if (top >= bottom)
			bottom = std::min(imageHeight - 1, top + static_cast<int>(moduleSize * kMinimumDimension));

		if (left >= right || top >= bottom)
			return DecodeError::notFound("Black area has no extent");

		int matrix_width  = std::lround((right - left + 1) / moduleSize);
		int matrix_height = std::lround((bottom - top + 1) / moduleSize);

		if (matrix_width <= 0 || matrix_height <= 0)
			return DecodeError::notFound("Black area is smaller than a cell");

		squareUpDimensions(matrix_width, matrix_height);

		// Start sampling in the middle of the cells
		int nudge = static_cast<int>(moduleSize / 2.0f);
		top += nudge;
		left += nudge;

		// But don't sample outside of the black area
		int nudged_too_far_right = left + static_cast<int>((matrix_width - 1) * moduleSize) - right;
		if (nudged_too_far_right > 0)
		{
			if (nudged_too_far_right > nudge)
				return DecodeError::notFound("Grid doesn't fit horizontally");

			left -= nudged_too_far_right;
		}

		int nudged_too_far_down = top + static_cast<int>((matrix_height - 1) * moduleSize) - bottom;
		if (nudged_too_far_down > 0)
		{
			if (nudged_too_far_down > nudge)
				return DecodeError::notFound("Grid doesn't fit vertically");

			top -= nudged_too_far_down;
		}

		return GridGeometry{left, top, matrix_width, matrix_height, moduleSize};
	}

	/**
	 * Qr Codes are always square. If width and height differ by more than a fifth,
	 * the area was not detected correctly and the smaller dimension is used for both.
	 *
	 * @param width		Width in cells, might be altered
	 * @param height	Height in cells, might be altered
	 */
	static void squareUpDimensions(int& width, int& height)
	{
		int smaller = std::min(width, height);
		if (std::abs(width - height) > smaller / 5)
		{
			width  = smaller;
			height = smaller;
		}
	}

	/**
	 * Reads every cell of the grid
	 * @param image		Monochrome image
	 * @param g			Grid to read
	 * @return			One element per cell
	 */
	static BitMatrix sampleGrid(const BitMatrix& image, const GridGeometry& g)
	{
		BitMatrix bits(g.width, g.height);
		int cell_size = static_cast<int>(g.moduleSize);

		for (int y = 0; y < g.height; y++)
		{
			int pixel_y = g.top + static_cast<int>(y * g.moduleSize);
			for (int x = 0; x < g.width; x++)
			{
				int pixel_x = g.left + static_cast<int>(x * g.moduleSize);
				if (GridSampler::sample(image, pixel_x, pixel_y, cell_size))
					bits.set(x, y);
			}
		}

		return bits;
	}
};

#endif /* PUREBITSEXTRACTOR_H_ */
