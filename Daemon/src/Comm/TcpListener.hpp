#pragma once

#include <QTcpServer>
#include "../ComponentCollection.hpp"





/** Listens for the TCP connections from the other devices.
Listens on the first free port in the Protocol::MIN_TCP_PORT .. MAX_TCP_PORT range, announces it through
LocalIdentity and hands the accepted sockets over to ConnectionMgr as inbound TlsConnections. */
class TcpListener:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckTcpListener>
{
	using Super = QObject;
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckTcpListener>;

	Q_OBJECT


public:

	/** The exception that is thrown when the server is not listening and its port is queried. */
	class NotListeningError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	explicit TcpListener(ComponentCollection & aComponents, QObject * aParent = nullptr);

	/** Starts listening on the first free port of the protocol range, on all interfaces.
	Throws a RuntimeError if no port in the range is free. */
	virtual void start() override;

	/** Stops listening. */
	void stop();

	/** The port on which mServer is listening.
	Throws a NotListeningError if not started yet. */
	quint16 listeningPort();


protected:

	/** The TCP server used for listening for connections. */
	QTcpServer mServer;

	Logger & mLogger;


protected Q_SLOTS:

	/** Creates a new Connection object for each new connection from the TCP server.
	Emitted by mServer when a new connection is requested. */
	void newConnection();
};
