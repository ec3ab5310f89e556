#pragma once

#include <QMap>
#include <QSet>
#include <QString>
#include <QStringList>

#include "transfer_types.h"

class DuplicatePolicy {
public:
    // One action per collision: the override when present, otherwise defaultAction.
    // Overrides naming paths outside the collision set are ignored.
    static DuplicateResolution resolve(const QStringList& collisions,
                                       DuplicateAction defaultAction,
                                       const QMap<QString, DuplicateAction>& overrides = {});

    // Collisions that have no action in the resolution, in input order.
    static QStringList findUnresolved(const QStringList& collisions, const DuplicateResolution& resolution);

    // "dir/name (n).ext" for the smallest n >= 1 whose folded form is not in taken.
    // The chosen name is inserted into taken.
    static QString autoRenameTarget(const QString& relativePath, QSet<QString>& taken, Qt::CaseSensitivity cs);

    static QString actionName(DuplicateAction action);
    static bool parseAction(const QString& name, DuplicateAction* out);
};
