/**
 * @file DecodeOutcome.h
 *
 *  Created on: 22.11.2021
 *      Author: andre
 */

#ifndef DECODEOUTCOME_H_
#define DECODEOUTCOME_H_

#include "decodeerror.h"
#include <cassert>
#include <utility>
#include <variant>

/**
 * Result of a decoding step which might fail.
 * Either contains the value or the \ref DecodeError which describes why there is none.
 *
 * @tparam T	Type of the value in case of success
 */
template <class T> class DecodeOutcome
{
  private:
	std::variant<T, DecodeError> storage_;

  public:
	DecodeOutcome(T value) : storage_(std::in_place_index<0>, std::move(value))
	{
	}

	DecodeOutcome(DecodeError error) : storage_(std::in_place_index<1>, std::move(error))
	{
	}

	/// true if a value is stored
	bool isValid() const
	{
		return storage_.index() == 0;
	}

	explicit operator bool() const
	{
		return isValid();
	}

	/// Must only be called if \ref isValid
	const T& value() const
	{
		assert(isValid());
		return std::get<0>(storage_);
	}

	/// Must only be called if \ref isValid
	T& value()
	{
		assert(isValid());
		return std::get<0>(storage_);
	}

	/// Must only be called if not \ref isValid
	const DecodeError& error() const
	{
		assert(!isValid());
		return std::get<1>(storage_);
	}
};

#endif /* DECODEOUTCOME_H_ */
