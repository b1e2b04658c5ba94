/**
 * @file TransitionScanner.h
 *
 *  Created on: 24.11.2021
 *      Author: andre
 */

#ifndef TRANSITIONSCANNER_H_
#define TRANSITIONSCANNER_H_

#include "BitMatrix.h"
#include <opencv2/opencv.hpp>

/**
 * Result of \ref TransitionScanner::scan
 */
struct TransitionScan
{
	/// Number of color changes which were found
	int transitions{0};

	/// Number of steps from the start until the last found transition or the edge of the image
	int distance{0};

	/// true, if the scan was stopped by the edge of the image
	bool reachedEdge{false};
};

/**
 * Walks along a ray through an image and counts changes between black and white.
 */
class TransitionScanner
{
  public:
	/**
	 * The scan starts on a black pixel and stops at the requested transition or at the edge of the image.
	 * The pixel which causes the final transition is not stepped over, so \ref TransitionScan::distance
	 * is the length of the runs in front of it.
	 *
	 * @param image		Monochrome image
	 * @param start		First pixel of the ray. Is assumed to be black.
	 * @param step		Offset to get from one pixel to the next one. (1,1) for a diagonal.
	 * @param wanted	Number of transitions after which the scan is stopped
	 * @return			Result of the scan
	 */
	static TransitionScan scan(const BitMatrix& image, cv::Point start, cv::Point step, int wanted)
	{
		TransitionScan result;
		cv::Point pos	= start;
		bool in_black	= true;
		int steps_taken = 0;

		while (pos.x >= 0 && pos.y >= 0 && pos.x < image.getWidth() && pos.y < image.getHeight())
		{
			if (in_black != image.get(pos.x, pos.y))
			{
				if (++result.transitions == wanted)
					break;

				in_black = !in_black;
			}

			pos += step;
			steps_taken++;
		}

		result.distance	   = steps_taken;
		result.reachedEdge = result.transitions < wanted;
		return result;
	}
};

#endif /* TRANSITIONSCANNER_H_ */
