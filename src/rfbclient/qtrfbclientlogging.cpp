// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qtrfbclientglobal.h"

QT_BEGIN_NAMESPACE

// Define the logging categories
Q_LOGGING_CATEGORY(lcRfbClient, "qt.rfbclient")
Q_LOGGING_CATEGORY(lcRfbCrypto, "qt.rfbclient.crypto")

QT_END_NAMESPACE
