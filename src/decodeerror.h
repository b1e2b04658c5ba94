/**
 * @file decodeerror.h
 *
 *  Created on: 22.11.2021
 *      Author: andre
 */

#ifndef DECODEERROR_H_
#define DECODEERROR_H_

#include <string>
#include <utility>

/**
 * Describes why a decoding step was not successful.
 * Returned by value inside of \ref DecodeOutcome instead of being thrown.
 */
class DecodeError
{
  public:
	/// All possible faults
	enum class Cause
	{
		kNotFound, ///< Expected structure is not in the image
		kFormat,   ///< Cells don't describe a valid code
		kChecksum  ///< Code is valid but error correction failed
	};

	/// Human readable text to explain the error cause
	static constexpr const char* whatStr[3] = {
		"Code not found",
		"Format error",
		"Checksum error",
	};

  private:
	/// Storage of cause
	Cause cause_;

	/// Additional info about the step which has failed
	std::string detail_;

  public:
	/**
	 * Construct this error
	 * @param c			Reason to fail
	 * @param detail	Optional additional text for diagnosis
	 */
	DecodeError(Cause c, std::string detail = "") : cause_(c), detail_(std::move(detail))
	{
	}

	Cause cause() const
	{
		return cause_;
	}

	const std::string& detail() const
	{
		return detail_;
	}

	/**
	 * Provides a text to explain the problem.
	 */
	const char* what() const noexcept
	{
		return whatStr[static_cast<int>(cause_)];
	}

	bool operator==(const DecodeError& other) const
	{
		return cause_ == other.cause_ && detail_ == other.detail_;
	}

	static DecodeError notFound(std::string detail = "")
	{
		return DecodeError(Cause::kNotFound, std::move(detail));
	}

	static DecodeError format(std::string detail = "")
	{
		return DecodeError(Cause::kFormat, std::move(detail));
	}

	static DecodeError checksum(std::string detail = "")
	{
		return DecodeError(Cause::kChecksum, std::move(detail));
	}
};

#endif /* DECODEERROR_H_ */
