#pragma once

#include <vector>
#include <QString>





/** The interface to the local audio system, used by SystemVolumePlugin.
The daemon itself ships only NullAudioBackend; real backends (PipeWire, PulseAudio) are provided by the shell. */
class AudioBackend
{
public:

	/** A single audio output. */
	struct Sink
	{
		/** The identifier of the sink, used by the device to address it. */
		QString mName;

		/** The human-readable description. */
		QString mDescription;

		int mVolume;
		bool mMuted;
		int mMaxVolume;

		/** True for the default sink. */
		bool mEnabled;
	};


	virtual ~AudioBackend() {}

	/** Returns all the current sinks. */
	virtual std::vector<Sink> sinks() = 0;

	/** Returns the name of the default sink, or an empty string if there's none. */
	virtual QString defaultSinkName() = 0;

	/** Sets the volume of the sink. Returns false if the sink doesn't exist or the volume cannot be set. */
	virtual bool setVolume(const QString & aSinkName, int aVolume) = 0;

	/** Mutes or unmutes the sink. Returns false on failure. */
	virtual bool setMuted(const QString & aSinkName, bool aMuted) = 0;

	/** Makes the sink the default one. Returns false on failure. */
	virtual bool setDefault(const QString & aSinkName) = 0;
};





/** An AudioBackend with no sinks at all. */
class NullAudioBackend:
	public AudioBackend
{
public:

	virtual std::vector<Sink> sinks() override { return {}; }
	virtual QString defaultSinkName() override { return QString(); }
	virtual bool setVolume(const QString & aSinkName, int aVolume) override { Q_UNUSED(aSinkName); Q_UNUSED(aVolume); return false; }
	virtual bool setMuted(const QString & aSinkName, bool aMuted) override { Q_UNUSED(aSinkName); Q_UNUSED(aMuted); return false; }
	virtual bool setDefault(const QString & aSinkName) override { Q_UNUSED(aSinkName); return false; }
};
