#include "duplicate_policy.h"

#include <QDebug>

DuplicateResolution DuplicatePolicy::resolve(const QStringList& collisions,
                                             DuplicateAction defaultAction,
                                             const QMap<QString, DuplicateAction>& overrides)
{
    DuplicateResolution r;
    for (const QString& path : collisions) {
        r.actions.insert(path, overrides.value(path, defaultAction));
    }

    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        if (!r.actions.contains(it.key())) {
            qWarning() << "[DuplicatePolicy] Ignoring override for non-colliding path" << it.key();
        }
    }
    return r;
}

QStringList DuplicatePolicy::findUnresolved(const QStringList& collisions, const DuplicateResolution& resolution)
{
    QStringList missing;
    for (const QString& path : collisions) {
        if (!resolution.contains(path)) missing << path;
    }
    return missing;
}

QString DuplicatePolicy::autoRenameTarget(const QString& relativePath, QSet<QString>& taken, Qt::CaseSensitivity cs)
{
    const int slash = relativePath.lastIndexOf('/');
    const QString dir = slash >= 0 ? relativePath.left(slash + 1) : QString();
    const QString fileName = relativePath.mid(slash + 1);

    // "clip.final.mov" -> stem "clip.final", ext ".mov"; dotfiles keep their whole name as stem
    const int dot = fileName.lastIndexOf('.');
    const QString stem = dot > 0 ? fileName.left(dot) : fileName;
    const QString ext = dot > 0 ? fileName.mid(dot) : QString();

    for (int n = 1;; ++n) {
        const QString candidate = dir + stem + QStringLiteral(" (") + QString::number(n) + QLatin1Char(')') + ext;
        const QString key = TransferTypes::foldPath(candidate, cs);
        if (!taken.contains(key)) {
            taken.insert(key);
            return candidate;
        }
    }
}

QString DuplicatePolicy::actionName(DuplicateAction action)
{
    switch (action) {
        case DuplicateAction::Skip: return "skip";
        case DuplicateAction::Overwrite: return "overwrite";
        case DuplicateAction::AutoRename: return "rename";
    }
    return QString();
}

bool DuplicatePolicy::parseAction(const QString& name, DuplicateAction* out)
{
    const QString n = name.trimmed().toLower();
    DuplicateAction a;
    if (n == "skip") a = DuplicateAction::Skip;
    else if (n == "overwrite") a = DuplicateAction::Overwrite;
    else if (n == "rename" || n == "autorename" || n == "auto-rename") a = DuplicateAction::AutoRename;
    else return false;
    if (out) *out = a;
    return true;
}
