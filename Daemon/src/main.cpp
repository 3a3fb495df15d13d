#include <memory>
#include <QCoreApplication>
#include <QDebug>
#include "ComponentCollection.hpp"
#include "DebugLogger.hpp"
#include "Device.hpp"
#include "DeviceMgr.hpp"
#include "Discovery.hpp"
#include "InstallConfiguration.hpp"
#include "LocalIdentity.hpp"
#include "MultiLogger.hpp"
#include "PairingService.hpp"
#include "Settings.hpp"
#include "DB/Database.hpp"
#include "DB/DbTrustStore.hpp"
#include "Comm/ConnectionMgr.hpp"
#include "Comm/TcpListener.hpp"
#include "Payload/PayloadTransfers.hpp"
#include "Plugins/AudioBackend.hpp"
#include "Plugins/InputSink.hpp"
#include "Plugins/MediaPlayerBackend.hpp"
#include "Plugins/MprisPlugin.hpp"
#include "Plugins/PingPlugin.hpp"
#include "Plugins/PluginRegistry.hpp"
#include "Plugins/RemoteInputPlugin.hpp"
#include "Plugins/SharePlugin.hpp"
#include "Plugins/SystemVolumePlugin.hpp"





/** Registers the plugins that come with the daemon. */
static void registerBuiltinPlugins(PluginRegistry & aRegistry, MultiLogger & aMultiLogger, const QString & aDownloadsFolder)
{
	aRegistry.registerFactory(PingPlugin::factory());
	aRegistry.registerFactory(RemoteInputPlugin::factory(
		std::make_shared<LoggingInputSink>(aMultiLogger.logger("Input"))
	));
	aRegistry.registerFactory(SystemVolumePlugin::factory(std::make_shared<NullAudioBackend>()));
	aRegistry.registerFactory(MprisPlugin::factory(std::make_shared<NullMediaPlayerBackend>()));
	aRegistry.registerFactory(SharePlugin::factory(aDownloadsFolder));
}





int main(int argc, char *argv[])
{
	// Initialize the DebugLogger:
	DebugLogger::get();

	QCoreApplication app(argc, argv);
	app.setApplicationName("Konduit");

	try
	{
		qRegisterMetaType<Packet>();
		qRegisterMetaType<DeviceIdentity>();
		qRegisterMetaType<Connection *>();
		qRegisterMetaType<ConnectionPtr>();
		qRegisterMetaType<Device::State>();
		qRegisterMetaType<PairingService::PairingResult>();

		ComponentCollection cc;
		auto instConf = std::make_shared<InstallConfiguration>(cc);
		Settings::init(InstallConfiguration::dataLocation("konduit.ini"));
		instConf->loadFromSettings();

		// Create the main app objects:
		cc.addComponent(instConf);
		const auto & deviceId = instConf->deviceId();
		auto multiLogger = cc.addNew<MultiLogger>(instConf->logsFolder());
		cc.addNew<Database>();
		cc.addNew<DbTrustStore>();
		auto registry    = cc.addNew<PluginRegistry>();
		cc.addNew<LocalIdentity>();
		auto listener    = cc.addNew<TcpListener>();
		auto connMgr     = cc.addNew<ConnectionMgr>();
		auto discovery   = cc.addNew<Discovery>(deviceId, instConf->livenessTimeoutMsec());
		cc.addNew<PairingService>(deviceId, instConf->pairingTimeoutMsec());
		auto devMgr      = cc.addNew<DeviceMgr>(deviceId, instConf->maxReconnectBackoffMsec());
		cc.addNew<PayloadTransfers>();
		auto & logger = multiLogger->mainLogger();
		registerBuiltinPlugins(*registry, *multiLogger, instConf->downloadsFolder());

		// There's no UI to confirm the pairing requests, optionally accept all of them:
		if (Settings::loadValue("Pairing", "AutoAcceptRequests", false).toBool())
		{
			logger.log("AutoAcceptRequests is enabled, all pairing requests will be accepted.");
			QObject::connect(devMgr.get(), &DeviceMgr::pairingRequested,
				[devMgr](const QString & aDeviceId)
				{
					devMgr->acceptPairing(aDeviceId);
				}
			);
		}
		QObject::connect(devMgr.get(), &DeviceMgr::connectionStateChanged,
			[&logger](const QString & aDeviceId, Device::State aNewState)
			{
				logger.log("Device %1 is now %2", aDeviceId, Device::stateToString(aNewState));
			}
		);

		// Start the components:
		logger.log("Starting as device %1 (%2)", deviceId, instConf->deviceName());
		cc.start();

		// Run the app:
		logger.log("Running the app...");
		auto res = app.exec();

		// Stop everything:
		logger.log("Stopping all...");
		discovery->stop();
		listener->stop();
		devMgr->stop();
		connMgr->stop();
		logger.log("Done.");

		return res;
	}
	catch (const std::exception & exc)
	{
		qCritical() << "Konduit has detected a fatal error: " << exc.what();
		return -1;
	}
}
