/**
 * @file iftpclient.cpp
 * @brief Translation unit for the IFtpClient interface.
 *
 * The interface declares signals, so moc output for it has to be compiled
 * into the library even though every method is pure virtual.
 */

#include "iftpclient.h"
