// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef QTRFBCLIENTGLOBAL_H
#define QTRFBCLIENTGLOBAL_H

#include <QtCore/qstring.h>
#include <QtCore/qglobal.h>
#include <QtCore/qdebug.h>
#include <QtCore/qloggingcategory.h>
// #include <QtRfbClient/qtrfbclientexports.h>

QT_BEGIN_NAMESPACE

using namespace Qt::Literals::StringLiterals;

Q_DECLARE_LOGGING_CATEGORY(lcRfbClient)
Q_DECLARE_LOGGING_CATEGORY(lcRfbCrypto)

QT_END_NAMESPACE

#endif // QTRFBCLIENTGLOBAL_H
