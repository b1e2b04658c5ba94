/**
 * @file DecoderResult.h
 *
 *  Created on: 23.11.2021
 *      Author: andre
 */

#ifndef DECODERRESULT_H_
#define DECODERRESULT_H_

#include <cstdint>
#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/// Position of a located feature of the code in image coordinates
using ResultPoint = cv::Point2f;

/**
 * Additional information about a decoded Qr Code, which only the decoder can tell.
 */
class QrCodeMetaData
{
  private:
	bool mirrored_;

  public:
	explicit QrCodeMetaData(bool mirrored) : mirrored_(mirrored)
	{
	}

	/// true, if the code was read as mirror image
	bool isMirrored() const
	{
		return mirrored_;
	}

	/**
	 * A mirrored code was found with bottom left and top right finder pattern swapped.
	 * This restores the correct order of the points.
	 *
	 * @param points	Bottom left, top left, top right and further optional points
	 */
	void applyMirroredCorrection(std::vector<ResultPoint>& points) const
	{
		if (!mirrored_ || points.size() < 3)
			return;

		std::swap(points.at(0), points.at(2));
	}
};

/**
 * Everything a \ref Decoder has found out about the payload of a code
 */
struct DecoderResult
{
	/// Payload as text
	std::string text;

	/// Payload as it was stored in the cells, after error correction
	std::vector<uint8_t> rawBytes;

	/// Content of each byte mode segment, if any
	std::optional<std::vector<std::vector<uint8_t>>> byteSegments;

	/// Error correction level as "L", "M", "Q" or "H"
	std::optional<std::string> ecLevel;

	/// Position of this code in a structured append sequence. -1 if not part of one.
	int structuredAppendSequenceNumber{-1};

	/// Parity of the whole structured append message. -1 if not part of one.
	int structuredAppendParity{-1};

	std::optional<QrCodeMetaData> metaData;

	bool hasStructuredAppend() const
	{
		return structuredAppendSequenceNumber >= 0 && structuredAppendParity >= 0;
	}
};

#endif /* DECODERRESULT_H_ */
