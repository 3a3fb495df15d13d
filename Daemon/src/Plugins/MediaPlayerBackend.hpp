#pragma once

#include <QObject>
#include <QStringList>
#include "../Optional.hpp"





/** The interface to the local media players, used by MprisPlugin.
On Linux desktops the players are reached over MPRIS D-Bus; that bridge lives in the shell, the daemon itself
ships only NullMediaPlayerBackend. The backend notifies about changes through its signals, which the plugins
forward to the devices. */
class MediaPlayerBackend:
	public QObject
{
	using Super = QObject;

	Q_OBJECT


public:

	/** The state of a single player, as reported to the devices. */
	struct PlayerState
	{
		bool mIsPlaying;

		/** The playback position, in msec. */
		qint64 mPosition;

		/** The track length, in msec. */
		qint64 mLength;

		/** The volume, 0 - 100. */
		int mVolume;

		QString mTitle;
		QString mArtist;
		QString mAlbum;

		/** "None", "Track" or "Playlist". */
		QString mLoopStatus;

		bool mShuffle;
		bool mCanPlay;
		bool mCanPause;
		bool mCanGoNext;
		bool mCanGoPrevious;
		bool mCanSeek;

		PlayerState():
			mIsPlaying(false),
			mPosition(0),
			mLength(0),
			mVolume(100),
			mLoopStatus("None"),
			mShuffle(false),
			mCanPlay(false),
			mCanPause(false),
			mCanGoNext(false),
			mCanGoPrevious(false),
			mCanSeek(false)
		{
		}
	};


	virtual ~MediaPlayerBackend() override {}

	/** Returns the names of all the players currently available. */
	virtual QStringList players() = 0;

	/** Returns the state of the specified player, or an empty Optional if there's no such player. */
	virtual Optional<PlayerState> playerState(const QString & aPlayer) = 0;

	/** Performs the action ("Play", "Pause", "PlayPause", "Stop", "Next", "Previous") on the player.
	Returns false on failure. */
	virtual bool performAction(const QString & aPlayer, const QString & aAction) = 0;

	/** Sets the volume (0 - 100) of the player. */
	virtual bool setVolume(const QString & aPlayer, int aVolume) = 0;

	/** Moves the playback position by the specified offset, in microseconds. */
	virtual bool seek(const QString & aPlayer, qint64 aOffsetUsec) = 0;

	/** Sets the playback position, in msec. */
	virtual bool setPosition(const QString & aPlayer, qint64 aPositionMsec) = 0;

	/** Sets the loop status ("None", "Track" or "Playlist"). */
	virtual bool setLoopStatus(const QString & aPlayer, const QString & aLoopStatus) = 0;

	virtual bool setShuffle(const QString & aPlayer, bool aShuffle) = 0;


signals:

	/** Emitted when a player appears or disappears. */
	void playerListChanged();

	/** Emitted when the state of the player changes. */
	void playerStateChanged(const QString & aPlayer);
};





/** A MediaPlayerBackend without any players. */
class NullMediaPlayerBackend:
	public MediaPlayerBackend
{
public:

	virtual QStringList players() override { return {}; }
	virtual Optional<PlayerState> playerState(const QString & aPlayer) override { Q_UNUSED(aPlayer); return {}; }
	virtual bool performAction(const QString & aPlayer, const QString & aAction) override { Q_UNUSED(aPlayer); Q_UNUSED(aAction); return false; }
	virtual bool setVolume(const QString & aPlayer, int aVolume) override { Q_UNUSED(aPlayer); Q_UNUSED(aVolume); return false; }
	virtual bool seek(const QString & aPlayer, qint64 aOffsetUsec) override { Q_UNUSED(aPlayer); Q_UNUSED(aOffsetUsec); return false; }
	virtual bool setPosition(const QString & aPlayer, qint64 aPositionMsec) override { Q_UNUSED(aPlayer); Q_UNUSED(aPositionMsec); return false; }
	virtual bool setLoopStatus(const QString & aPlayer, const QString & aLoopStatus) override { Q_UNUSED(aPlayer); Q_UNUSED(aLoopStatus); return false; }
	virtual bool setShuffle(const QString & aPlayer, bool aShuffle) override { Q_UNUSED(aPlayer); Q_UNUSED(aShuffle); return false; }
};
