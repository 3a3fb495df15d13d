#pragma once

#include <functional>
#include <memory>
#include <QStringList>
#include "Plugin.hpp"





/** Describes a single plugin kind: its name, the packet types it handles and sends, and how to create
a new instance of it for a device. */
class PluginFactory
{
public:

	/** The function that creates a new plugin instance for the device. */
	using Creator = std::function<PluginPtr(const QString & aDeviceId, PacketRouter & aRouter, Logger & aDeviceLogger)>;


	PluginFactory(
		const QString & aName,
		const QStringList & aIncomingCapabilities,
		const QStringList & aOutgoingCapabilities,
		Creator aCreator
	):
		mName(aName),
		mIncomingCapabilities(aIncomingCapabilities),
		mOutgoingCapabilities(aOutgoingCapabilities),
		mCreator(std::move(aCreator))
	{
	}

	// Simple getters:
	const QString & name() const { return mName; }
	const QStringList & incomingCapabilities() const { return mIncomingCapabilities; }
	const QStringList & outgoingCapabilities() const { return mOutgoingCapabilities; }

	/** Returns true if any of the plugin's capabilities (incoming or outgoing) is in aCapabilities. */
	bool isApplicable(const QStringList & aCapabilities) const
	{
		for (const auto & cap: mIncomingCapabilities)
		{
			if (aCapabilities.contains(cap))
			{
				return true;
			}
		}
		for (const auto & cap: mOutgoingCapabilities)
		{
			if (aCapabilities.contains(cap))
			{
				return true;
			}
		}
		return false;
	}

	/** Creates a new plugin instance for the specified device. */
	PluginPtr create(const QString & aDeviceId, PacketRouter & aRouter, Logger & aDeviceLogger) const
	{
		return mCreator(aDeviceId, aRouter, aDeviceLogger);
	}


protected:

	QString mName;

	/** The packet types that the plugin handles. */
	QStringList mIncomingCapabilities;

	/** The packet types that the plugin may send. */
	QStringList mOutgoingCapabilities;

	Creator mCreator;
};

using PluginFactoryPtr = std::shared_ptr<PluginFactory>;
