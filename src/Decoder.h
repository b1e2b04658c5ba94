/**
 * @file Decoder.h
 *
 *  Created on: 23.11.2021
 *      Author: andre
 */

#ifndef DECODER_H_
#define DECODER_H_

#include "BitMatrix.h"
#include "DecodeHints.h"
#include "DecodeOutcome.h"
#include "DecoderResult.h"

/**
 * Turns the cells of a rectified code into payload data.
 * Error correction, unmasking and character set interpretation happen here.
 * Implementations must not keep state between calls of \ref decode.
 */
class Decoder
{
  public:
	virtual ~Decoder() = default;

	/**
	 * @param bits		One element per cell of the code
	 * @param hints		Options of this decoding attempt
	 * @return			Payload or kFormat / kChecksum
	 */
	virtual DecodeOutcome<DecoderResult> decode(const BitMatrix& bits, const DecodeHints& hints) const = 0;
};

#endif /* DECODER_H_ */
