/**
 * @file QrReader.h
 *
 *  Created on: 29.11.2021
 *      Author: andre
 */

#ifndef QRREADER_H_
#define QRREADER_H_

#include "BitMatrix.h"
#include "DecodeHints.h"
#include "DecodeOutcome.h"
#include "DecodeResult.h"
#include "Decoder.h"
#include "Detector.h"
#include "FinderPatternDetector.h"
#include "PureBitsExtractor.h"
#include <cassert>
#include <memory>
#include <stdio.h>

/**
 * Qr Code Reader
 *
 * Finds the cells of a code in a monochrome image and lets the \ref Decoder turn them into payload.
 * If the first attempt fails, the image is read again, assuming that it only contains the code.
 *
 * \ref decode doesn't modify this object. It is safe to call it from multiple threads at the same time
 * as long as the provided \ref Decoder and \ref Detector are safe for that as well.
 * \ref FinderPatternDetector and \ref PureBitsExtractor are.
 */
class QrReader
{
  private:
	std::unique_ptr<Decoder> decoder_;
	std::unique_ptr<Detector> detector_;

	/**
	 * A single attempt to read the code
	 * @param image		Monochrome image
	 * @param hints		If pure barcode mode is set, no detection is performed
	 * @return			Result or error of either cell extraction or decoder
	 */
	DecodeOutcome<DecodeResult> decodeInternal(const BitMatrix& image, const DecodeHints& hints) const
	{
		BitMatrix bits;
		std::vector<ResultPoint> points;

		if (hints.isPureBarcode())
		{
			PureBitsExtractor extractor;
			extractor.debugMode = debugMode;

			auto extracted = extractor.extract(image);
			if (!extracted)
				return extracted.error();

			bits = std::move(extracted.value());
		}
		else
		{
			auto detected = detector_->detect(image, hints);
			if (!detected)
				return detected.error();

			bits   = std::move(detected.value().bits);
			points = std::move(detected.value().points);
		}

		auto decoded = decoder_->decode(bits, hints);
		if (!decoded)
			return decoded.error();

		DecoderResult& decoder_result = decoded.value();

		// If the code was mirrored: swap the bottom left and the top right points.
		if (decoder_result.metaData)
			decoder_result.metaData->applyMirroredCorrection(points);

		DecodeResult result;
		result.text		= std::move(decoder_result.text);
		result.rawBytes = std::move(decoder_result.rawBytes);
		result.points	= std::move(points);
		result.format	= BarcodeFormat::kQrCode;

		if (decoder_result.byteSegments)
			result.putMetadata(ResultMetadataType::kByteSegments, *decoder_result.byteSegments);

		if (decoder_result.ecLevel)
			result.putMetadata(ResultMetadataType::kErrorCorrectionLevel, *decoder_result.ecLevel);

		if (decoder_result.hasStructuredAppend())
		{
			result.putMetadata(ResultMetadataType::kStructuredAppendSequence,
							   decoder_result.structuredAppendSequenceNumber);
			result.putMetadata(ResultMetadataType::kStructuredAppendParity, decoder_result.structuredAppendParity);
		}

		return result;
	}

  public:
	/// If true, the retry logic and the pure barcode extraction are more verbose.
	/// The detector is traced with its own flag, e.g. \ref FinderPatternDetector::debugMode
	bool debugMode{false};

	/**
	 * @param decoder	Turns cells into payload. Must not be null.
	 * @param detector	Locates the code if not in pure barcode mode. Must not be null.
	 */
	explicit QrReader(std::unique_ptr<Decoder> decoder,
					  std::unique_ptr<Detector> detector = std::make_unique<FinderPatternDetector>())
		: decoder_(std::move(decoder)), detector_(std::move(detector))
	{
		assert(decoder_);
		assert(detector_);
	}

	/**
	 * Reads a Qr Code from a monochrome image.
	 *
	 * Try harder is always enabled unless explicitly disabled.
	 * If the first attempt fails and pure barcode mode was not requested, the image is read again
	 * in pure barcode mode. If that fails as well, the error of the first attempt is returned.
	 *
	 * @param image		Monochrome image
	 * @param hints		Options. Are not modified.
	 * @return			Payload of the code or kNotFound, kFormat, kChecksum
	 */
	DecodeOutcome<DecodeResult> decode(const BitMatrix& image, const DecodeHints& hints) const
	{
		DecodeHints enhanced_hints = hints;
		if (!enhanced_hints.tryHarder)
			enhanced_hints.tryHarder = true;

		auto first_attempt = decodeInternal(image, enhanced_hints);
		if (first_attempt || enhanced_hints.isPureBarcode())
			return first_attempt;

		if (debugMode)
		{
			printf("First attempt failed: %s (%s). Trying again in pure barcode mode\n", first_attempt.error().what(),
				   first_attempt.error().detail().c_str());
		}

		enhanced_hints.pureBarcode = true;
		auto second_attempt		   = decodeInternal(image, enhanced_hints);
		if (second_attempt)
			return second_attempt;

		if (debugMode)
		{
			printf("Pure barcode mode failed as well: %s (%s)\n", second_attempt.error().what(),
				   second_attempt.error().detail().c_str());
		}

		return first_attempt;
	}

	DecodeOutcome<DecodeResult> decode(const BitMatrix& image) const
	{
		return decode(image, DecodeHints());
	}
};

#endif /* QRREADER_H_ */
