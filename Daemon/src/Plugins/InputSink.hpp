#pragma once

#include <QString>
#include "../Logger.hpp"





/** The interface to the local input injection (pointer and keyboard).
RemoteInputPlugin translates the device's requests into these calls; the actual injection is platform-specific
and lives outside the daemon. The default LoggingInputSink only logs the events. */
class InputSink
{
public:

	/** The non-printable keys, as numbered in the mousepad packets. */
	enum SpecialKey
	{
		skNone      = 0,
		skBackspace = 1,
		skTab       = 2,
		skEnter     = 12,
		skLeft      = 21,
		skUp        = 22,
		skRight     = 23,
		skDown      = 24,
		skPageUp    = 25,
		skPageDown  = 26,
		skEscape    = 27,
		skHome      = 28,
		skEnd       = 29,
		skDelete    = 30,
		skF1        = 31,
		skF12       = 42,
	};


	enum MouseButton
	{
		mbLeft,
		mbMiddle,
		mbRight,
	};


	/** The modifier keys held together with a key. */
	struct Modifiers
	{
		bool mAlt;
		bool mCtrl;
		bool mShift;
		bool mSuper;

		Modifiers():
			mAlt(false),
			mCtrl(false),
			mShift(false),
			mSuper(false)
		{
		}
	};


	virtual ~InputSink() {}

	virtual void movePointer(double aDx, double aDy) = 0;
	virtual void scroll(double aDx, double aDy) = 0;
	virtual void click(MouseButton aButton) = 0;
	virtual void doubleClick() = 0;
	virtual void pressButton(MouseButton aButton) = 0;
	virtual void releaseButton(MouseButton aButton) = 0;

	/** Types the specified text, with the modifiers held. */
	virtual void typeText(const QString & aText, const Modifiers & aModifiers) = 0;

	/** Presses and releases the specified special key (one of SpecialKey, or any other number the device sends). */
	virtual void pressSpecialKey(int aSpecialKey, const Modifiers & aModifiers) = 0;

	/** Returns the human-readable name of the special key, such as "Backspace" or "F5". */
	static QString specialKeyName(int aSpecialKey);

	/** Returns the human-readable representation of the modifiers, such as "Ctrl+Shift+". */
	static QString modifiersToString(const Modifiers & aModifiers);
};





/** An InputSink that only logs the events. */
class LoggingInputSink:
	public InputSink
{
public:

	explicit LoggingInputSink(Logger & aLogger):
		mLogger(aLogger)
	{
	}

	// InputSink overrides:
	virtual void movePointer(double aDx, double aDy) override;
	virtual void scroll(double aDx, double aDy) override;
	virtual void click(MouseButton aButton) override;
	virtual void doubleClick() override;
	virtual void pressButton(MouseButton aButton) override;
	virtual void releaseButton(MouseButton aButton) override;
	virtual void typeText(const QString & aText, const Modifiers & aModifiers) override;
	virtual void pressSpecialKey(int aSpecialKey, const Modifiers & aModifiers) override;


protected:

	Logger & mLogger;
};
