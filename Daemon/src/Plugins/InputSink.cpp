#include "InputSink.hpp"





static const char * buttonName(InputSink::MouseButton aButton)
{
	switch (aButton)
	{
		case InputSink::mbLeft:   return "left";
		case InputSink::mbMiddle: return "middle";
		case InputSink::mbRight:  return "right";
	}
	return "unknown";
}





////////////////////////////////////////////////////////////////////////////////
// InputSink:

QString InputSink::specialKeyName(int aSpecialKey)
{
	if ((aSpecialKey >= skF1) && (aSpecialKey <= skF12))
	{
		return QString("F%1").arg(aSpecialKey - skF1 + 1);
	}
	switch (aSpecialKey)
	{
		case skBackspace: return "Backspace";
		case skTab:       return "Tab";
		case skEnter:     return "Enter";
		case skLeft:      return "Left";
		case skUp:        return "Up";
		case skRight:     return "Right";
		case skDown:      return "Down";
		case skPageUp:    return "PageUp";
		case skPageDown:  return "PageDown";
		case skEscape:    return "Escape";
		case skHome:      return "Home";
		case skEnd:       return "End";
		case skDelete:    return "Delete";
	}
	return QString("<key %1>").arg(aSpecialKey);
}





QString InputSink::modifiersToString(const InputSink::Modifiers & aModifiers)
{
	QString res;
	if (aModifiers.mCtrl)
	{
		res.append("Ctrl+");
	}
	if (aModifiers.mAlt)
	{
		res.append("Alt+");
	}
	if (aModifiers.mShift)
	{
		res.append("Shift+");
	}
	if (aModifiers.mSuper)
	{
		res.append("Super+");
	}
	return res;
}





////////////////////////////////////////////////////////////////////////////////
// LoggingInputSink:

void LoggingInputSink::movePointer(double aDx, double aDy)
{
	mLogger.log("Input: move pointer by %1, %2", aDx, aDy);
}





void LoggingInputSink::scroll(double aDx, double aDy)
{
	mLogger.log("Input: scroll by %1, %2", aDx, aDy);
}





void LoggingInputSink::click(InputSink::MouseButton aButton)
{
	mLogger.log("Input: %1 click", buttonName(aButton));
}





void LoggingInputSink::doubleClick()
{
	mLogger.log("Input: double click");
}





void LoggingInputSink::pressButton(InputSink::MouseButton aButton)
{
	mLogger.log("Input: %1 button pressed", buttonName(aButton));
}





void LoggingInputSink::releaseButton(InputSink::MouseButton aButton)
{
	mLogger.log("Input: %1 button released", buttonName(aButton));
}





void LoggingInputSink::typeText(const QString & aText, const InputSink::Modifiers & aModifiers)
{
	mLogger.log("Input: type %1%2", modifiersToString(aModifiers), aText);
}





void LoggingInputSink::pressSpecialKey(int aSpecialKey, const InputSink::Modifiers & aModifiers)
{
	mLogger.log("Input: key %1%2", modifiersToString(aModifiers), specialKeyName(aSpecialKey));
}
