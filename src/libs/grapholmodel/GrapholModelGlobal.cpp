// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "grapholmodel/GrapholModelGlobal.hpp"

Q_LOGGING_CATEGORY(grapholmodellog, "eddy.grapholmodel")
