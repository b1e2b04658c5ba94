/**
 * @file DecodeResult.h
 *
 *  Created on: 23.11.2021
 *      Author: andre
 */

#ifndef DECODERESULT_H_
#define DECODERESULT_H_

#include "DecoderResult.h"
#include <map>
#include <variant>

enum class BarcodeFormat
{
	kQrCode
};

/// Keys of \ref DecodeResult::metadata
enum class ResultMetadataType
{
	kByteSegments,			   ///< std::vector<std::vector<uint8_t>>
	kErrorCorrectionLevel,	   ///< std::string
	kStructuredAppendSequence, ///< int
	kStructuredAppendParity	   ///< int
};

using ResultMetadataValue = std::variant<int, std::string, std::vector<std::vector<uint8_t>>>;

/**
 * Final result of \ref QrReader::decode
 */
struct DecodeResult
{
	std::string text;
	std::vector<uint8_t> rawBytes;

	/// Finder pattern centers. Empty if the code was read in pure barcode mode.
	std::vector<ResultPoint> points;

	BarcodeFormat format{BarcodeFormat::kQrCode};

	/// Only contains entries the decoder could provide
	std::map<ResultMetadataType, ResultMetadataValue> metadata;

	void putMetadata(ResultMetadataType type, ResultMetadataValue value)
	{
		metadata[type] = std::move(value);
	}

	bool hasMetadata(ResultMetadataType type) const
	{
		return metadata.count(type) > 0;
	}
};

#endif /* DECODERESULT_H_ */
