// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(GRAPHOLMODEL_BUILD_SHARED) && (GRAPHOLMODEL_BUILD_SHARED == 1)
#	if defined(GRAPHOLMODEL_LIBRARY)
#		define GRAPHOLMODEL_EXPORT Q_DECL_EXPORT
#	else
#		define GRAPHOLMODEL_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define GRAPHOLMODEL_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(grapholmodellog)
