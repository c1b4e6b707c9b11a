// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "grapholmodel/GrapholModelGlobal.hpp"
#include "grapholmodel/ItemType.hpp"

#include <QtCore/QString>

namespace GrapholModel {

class Diagram;
class GrapholItem;

// Notifications are delivered synchronously, after the index has been updated.
// On diagram add the diagram notification precedes its item notifications;
// on diagram removal it follows them.
class GRAPHOLMODEL_EXPORT ProjectIndexListener
{
public:
	virtual ~ProjectIndexListener() = default;

	virtual void diagramAdded(Diagram&) {}
	virtual void diagramRemoved(Diagram&) {}
	virtual void itemAdded(Diagram&, GrapholItem&) {}
	virtual void itemRemoved(Diagram&, GrapholItem&) {}
	virtual void metaAdded(ItemType, const QString&) {}
	virtual void metaRemoved(ItemType, const QString&) {}
	virtual void metasCleared() {}
};

} // namespace GrapholModel
