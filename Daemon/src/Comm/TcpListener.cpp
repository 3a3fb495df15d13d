#include "TcpListener.hpp"
#include <QTcpSocket>
#include "../LocalIdentity.hpp"
#include "../Protocol.hpp"
#include "ConnectionMgr.hpp"
#include "TlsConnection.hpp"





TcpListener::TcpListener(ComponentCollection & aComponents, QObject * aParent):
	Super(aParent),
	ComponentSuper(aComponents),
	mLogger(aComponents.logger("TcpListener"))
{
	requireForStart(ComponentCollection::ckLocalIdentity);
	requireForStart(ComponentCollection::ckConnectionMgr);
	connect(&mServer, &QTcpServer::newConnection, this, &TcpListener::newConnection);
}





void TcpListener::start()
{
	if (mServer.isListening())
	{
		throw LogicError(mLogger, "The TCP listener has already been started");
	}
	for (auto port = Protocol::MIN_TCP_PORT; port <= Protocol::MAX_TCP_PORT; ++port)
	{
		if (mServer.listen(QHostAddress::Any, port))
		{
			break;
		}
		mLogger.log("Cannot listen on port %1: %2", port, mServer.errorString());
	}
	if (!mServer.isListening())
	{
		throw RuntimeError(mLogger, "No free TCP port in the range %1 - %2", Protocol::MIN_TCP_PORT, Protocol::MAX_TCP_PORT);
	}
	mComponents.get<LocalIdentity>()->setTcpPort(listeningPort());
	mLogger.log("The TCP listener has started on port %1", listeningPort());
}





void TcpListener::stop()
{
	if (!mServer.isListening())
	{
		return;
	}
	mLogger.log("Stopping the server...");
	mServer.close();
	mComponents.get<LocalIdentity>()->setTcpPort(0);
	mLogger.log("Server stopped.");
}





quint16 TcpListener::listeningPort()
{
	if (!mServer.isListening())
	{
		throw NotListeningError(mLogger, "The TCP server is not listening");
	}
	return mServer.serverPort();
}





void TcpListener::newConnection()
{
	while (auto socket = mServer.nextPendingConnection())
	{
		mLogger.log("New connection from %1:%2", socket->peerAddress(), socket->peerPort());
		auto conn = TlsConnection::fromAccepted(mComponents, socket);
		mComponents.get<ConnectionMgr>()->addConnection(conn);
	}
}
