#pragma once

#include <utility>
#include "Exception.hpp"





/** The result of a lookup that may find nothing: a trust store entry, a device snapshot, an identity that
hasn't been received yet.
Assigning a T makes the value present; value() on an empty instance throws a LogicError. */
template <typename T>
class Optional
{
public:

	/** Creates an empty instance. */
	Optional():
		mIsPresent(false)
	{
	}


	Optional(const T & aValue):
		mIsPresent(true),
		mValue(aValue)
	{
	}


	Optional(T && aValue):
		mIsPresent(true),
		mValue(std::move(aValue))
	{
	}


	bool isPresent() const { return mIsPresent; }


	T & value()
	{
		checkPresent();
		return mValue;
	}


	const T & value() const
	{
		checkPresent();
		return mValue;
	}


protected:

	bool mIsPresent;

	/** Default-constructed while not present. */
	T mValue;


	void checkPresent() const
	{
		if (!mIsPresent)
		{
			throw LogicError("Accessing the value of an empty Optional");
		}
	}
};
