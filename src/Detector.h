/**
 * @file Detector.h
 *
 *  Created on: 23.11.2021
 *      Author: andre
 */

#ifndef DETECTOR_H_
#define DETECTOR_H_

#include "BitMatrix.h"
#include "DecodeHints.h"
#include "DecodeOutcome.h"
#include "DecoderResult.h"
#include <vector>

/// Rectified code as found by a \ref Detector
struct DetectorResult
{
	/// One element per cell of the code
	BitMatrix bits;

	/// Located features in image coordinates
	std::vector<ResultPoint> points;
};

/**
 * Locates a code inside of an image and rectifies it into a grid of cells.
 * Implementations must not keep state between calls of \ref detect.
 */
class Detector
{
  public:
	virtual ~Detector() = default;

	/**
	 * @param image		Monochrome image
	 * @param hints		Options of this decoding attempt
	 * @return			Cells and feature points or kNotFound
	 */
	virtual DecodeOutcome<DetectorResult> detect(const BitMatrix& image, const DecodeHints& hints) const = 0;
};

#endif /* DETECTOR_H_ */
