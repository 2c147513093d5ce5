/**
 * @file iftpsocket.cpp
 * @brief Translation unit for the IFtpSocket interface.
 *
 * Holds the moc output for the socket signals shared by TcpFtpSocket and the
 * test transports.
 */

#include "iftpsocket.h"
