#pragma once

#include <QtGlobal>





/** Constants of the KDE Connect protocol, shared by all the parts of the daemon. */
namespace Protocol
{

/** The protocol version that we announce and require from the peers. */
static const int PROTOCOL_VERSION = 8;

/** The UDP port on which the identity broadcasts are sent and received. */
static const quint16 UDP_PORT = 1716;

/** The range of TCP ports where the devices listen for the main connections. */
static const quint16 MIN_TCP_PORT = 1716;
static const quint16 MAX_TCP_PORT = 1764;

/** The range of TCP ports used for the payload transfers. */
static const quint16 MIN_PAYLOAD_PORT = 1739;
static const quint16 MAX_PAYLOAD_PORT = 1764;

/** The longest packet line accepted from the network, in bytes.
A longer line without a terminating newline is considered an attack and the connection is dropped. */
static const int MAX_PACKET_SIZE = 4 * 1024 * 1024;

static const char PACKET_TYPE_IDENTITY[] = "kdeconnect.identity";
static const char PACKET_TYPE_PAIR[] = "kdeconnect.pair";

}  // namespace Protocol
