/**
 * @file ModuleSizeEstimator.h
 *
 *  Created on: 24.11.2021
 *      Author: andre
 */

#ifndef MODULESIZEESTIMATOR_H_
#define MODULESIZEESTIMATOR_H_

#include "BitMatrix.h"
#include "DecodeOutcome.h"
#include "TransitionScanner.h"

/**
 * Estimates the size of a cell in pixels using the top left finder pattern.
 *
 * A finder pattern is 7x7 cells in size and has a 1:1:3:1:1 ratio of black and white cells
 * along any line through its center. Starting at its outer corner, 5 transitions are passed
 * until the white separator around the pattern is reached, which is exactly 7 cells away.
 */
class ModuleSizeEstimator
{
  public:
	/// Transitions between the outer corner of a finder pattern and its separator
	static constexpr int kTransitions = 5;

	/// Width of a finder pattern in cells
	static constexpr float kFinderPatternCells = 7.0f;

	/// Returned by \ref alongAxis if no size could be measured
	static constexpr float kUnusable = -1.0f;

	/**
	 * Combines diagonal, horizontal and vertical measurement.
	 * The diagonal one is mandatory. The others are only used if they could be measured.
	 *
	 * @param image		Monochrome image
	 * @param topLeft	Outer corner of the top left finder pattern
	 * @return			Average cell size in pixels or kNotFound
	 */
	static DecodeOutcome<float> estimate(const BitMatrix& image, cv::Point topLeft)
	{
		auto diagonal = fromDiagonal(image, topLeft);
		if (!diagonal)
			return diagonal.error();

		float horizontal = alongAxis(image, topLeft, true);
		float vertical	 = alongAxis(image, topLeft, false);

		float best_size = diagonal.value();
		int valid_sizes = 1;

		if (horizontal > 0)
		{
			best_size += horizontal;
			valid_sizes++;
		}

		if (vertical > 0)
		{
			best_size += vertical;
			valid_sizes++;
		}

		return best_size / valid_sizes;
	}

	/**
	 * Measurement along the diagonal down right
	 * @return	cell size or kNotFound if the edge of the image was reached before enough transitions
	 */
	static DecodeOutcome<float> fromDiagonal(const BitMatrix& image, cv::Point topLeft)
	{
		auto scan = TransitionScanner::scan(image, topLeft, cv::Point(1, 1), kTransitions);
		if (scan.reachedEdge)
			return DecodeError::notFound("Not enough transitions on the diagonal");

		return scan.distance / kFinderPatternCells;
	}

	/**
	 * Measurement to the right or down
	 * @param horizontal	true to go right, false to go down
	 * @return				cell size or \ref kUnusable
	 */
	static float alongAxis(const BitMatrix& image, cv::Point topLeft, bool horizontal)
	{
		cv::Point step = horizontal ? cv::Point(1, 0) : cv::Point(0, 1);

		auto scan = TransitionScanner::scan(image, topLeft, step, kTransitions);
		if (scan.reachedEdge)
			return kUnusable;

		return scan.distance / kFinderPatternCells;
	}
};

#endif /* MODULESIZEESTIMATOR_H_ */
