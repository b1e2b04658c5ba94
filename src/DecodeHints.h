/**
 * @file DecodeHints.h
 *
 *  Created on: 23.11.2021
 *      Author: andre
 */

#ifndef DECODEHINTS_H_
#define DECODEHINTS_H_

#include <map>
#include <optional>
#include <string>

/**
 * Options for a single call of \ref QrReader::decode.
 * Options which are not set are distinguishable from options which are explicitly set to false.
 */
struct DecodeHints
{
	/// Prefer slower but more thorough search strategies
	std::optional<bool> tryHarder;

	/// The image contains only the code, without surrounding and without rotation.
	/// No detection step is performed. Cells are directly extracted.
	std::optional<bool> pureBarcode;

	/// Expected character set of the payload. Only interpreted by the \ref Decoder
	std::string characterSet;

	/// Further decoder specific options. Passed through without modification.
	std::map<std::string, std::string> extensions;

	bool isTryHarder() const
	{
		return tryHarder.value_or(false);
	}

	bool isPureBarcode() const
	{
		return pureBarcode.value_or(false);
	}
};

#endif /* DECODEHINTS_H_ */
