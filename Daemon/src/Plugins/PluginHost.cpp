#include "PluginHost.hpp"
#include <algorithm>
#include <QDebug>





PluginHost::PluginHost(const QString & aDeviceId, const QStringList & aNegotiatedCapabilities, Logger & aLogger):
	mDeviceId(aDeviceId),
	mNegotiatedCapabilities(aNegotiatedCapabilities),
	mIsStarted(false),
	mIsStopped(false),
	mLogger(aLogger)
{
}





PluginHost::~PluginHost()
{
	if (mIsStarted && !mIsStopped)
	{
		stop();
	}
}





void PluginHost::addPlugin(PluginPtr aPlugin, const QStringList & aIncomingCapabilities)
{
	if (mIsStarted)
	{
		throw LogicError(mLogger, "Cannot add plugin %1, the plugin host is already started", aPlugin->name());
	}
	mPlugins.push_back(aPlugin);
	for (const auto & cap: aIncomingCapabilities)
	{
		if (mNegotiatedCapabilities.contains(cap))
		{
			mDispatchMap[cap].push_back(aPlugin);
		}
	}
}





void PluginHost::start()
{
	if (mIsStarted)
	{
		return;
	}
	mIsStarted = true;
	auto plugins = mPlugins;
	for (const auto & plugin: plugins)
	{
		try
		{
			plugin->init();
			plugin->start();
		}
		catch (const std::exception & exc)
		{
			mLogger.log("Plugin %1 failed to start, disabling it: %2", plugin->name(), exc.what());
			removePlugin(plugin);
		}
	}
	mLogger.log("Plugin host started with %1 plugins", mPlugins.size());
}





void PluginHost::stop()
{
	if (mIsStopped)
	{
		return;
	}
	mIsStopped = true;
	for (const auto & plugin: mPlugins)
	{
		try
		{
			plugin->stop();
		}
		catch (const std::exception & exc)
		{
			mLogger.log("Plugin %1 failed to stop cleanly: %2", plugin->name(), exc.what());
		}
	}
	mLogger.log("Plugin host stopped");
}





size_t PluginHost::dispatch(const Packet & aPacket)
{
	if (mIsStopped)
	{
		mLogger.log("Dropping packet %1, the plugin host is stopped", aPacket.type());
		return 0;
	}
	auto itr = mDispatchMap.find(aPacket.type());
	if ((itr == mDispatchMap.end()) || itr->second.empty())
	{
		qDebug() << "No plugin handles packet type" << aPacket.type() << "from device" << mDeviceId;
		return 0;
	}

	// Copy the list, a plugin may cause the host to be stopped while handling the packet:
	auto handlers = itr->second;
	for (const auto & plugin: handlers)
	{
		try
		{
			plugin->handlePacket(aPacket);
		}
		catch (const Plugin::PluginError & exc)
		{
			mLogger.log("Plugin %1 failed to handle packet %2: %3", plugin->name(), aPacket.type(), exc.what());
		}
		catch (const std::exception & exc)
		{
			mLogger.log("Plugin %1 threw an unexpected exception while handling packet %2: %3",
				plugin->name(), aPacket.type(), exc.what()
			);
		}
	}
	return handlers.size();
}





PluginPtr PluginHost::plugin(const QString & aName) const
{
	for (const auto & p: mPlugins)
	{
		if (p->name() == aName)
		{
			return p;
		}
	}
	return nullptr;
}





void PluginHost::removePlugin(const PluginPtr & aPlugin)
{
	mPlugins.erase(std::remove(mPlugins.begin(), mPlugins.end(), aPlugin), mPlugins.end());
	for (auto & dispatch: mDispatchMap)
	{
		auto & list = dispatch.second;
		list.erase(std::remove(list.begin(), list.end(), aPlugin), list.end());
	}
}
