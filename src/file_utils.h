#pragma once

#include <QString>
#include <QFileInfo>
#include <QDir>

/**
 * FileUtils - Path predicates shared by preflight and command building
 *
 * The lexical helpers (cleanAbsolute, isSameOrInside) never touch the disk so the
 * command builder can stay free of I/O. The remaining helpers stat the filesystem.
 */
namespace FileUtils {

/**
 * Check if a directory exists at the given path.
 *
 * @param dirPath The directory path to check
 * @return true if the directory exists, false otherwise
 */
inline bool dirExists(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir();
}

/**
 * Check that a directory exists and new entries can be created in it.
 */
inline bool isWritableDir(const QString& dirPath)
{
    QFileInfo fi(dirPath);
    return fi.exists() && fi.isDir() && fi.isWritable();
}

/**
 * Clean a path lexically ('.' and '..' collapsed, trailing separator dropped).
 * Does not resolve symlinks and does not require the path to exist.
 */
inline QString cleanAbsolute(const QString& path)
{
    return QDir::cleanPath(QDir::fromNativeSeparators(path));
}

/**
 * True when child equals parent or lies below it. Both paths are compared
 * lexically after cleaning.
 */
inline bool isSameOrInside(const QString& parent, const QString& child, Qt::CaseSensitivity cs)
{
    const QString p = cleanAbsolute(parent);
    const QString c = cleanAbsolute(child);
    if (c.compare(p, cs) == 0) return true;
    const QString prefix = p.endsWith('/') ? p : p + '/';
    return c.startsWith(prefix, cs);
}

/**
 * Walk up from path until an existing entry is found. Returns an empty string
 * when nothing along the chain exists (e.g. an unmounted drive).
 */
inline QString nearestExistingAncestor(const QString& path)
{
    QString cur = cleanAbsolute(path);
    while (!cur.isEmpty()) {
        if (QFileInfo::exists(cur)) return cur;
        const QString parent = QFileInfo(cur).path();
        if (parent == cur) break;
        cur = parent;
    }
    return QString();
}

/**
 * Canonical form of a path that may not exist yet: the nearest existing ancestor
 * is canonicalized and the missing tail re-appended.
 */
inline QString canonicalOrCleaned(const QString& path)
{
    const QString cleaned = cleanAbsolute(path);
    const QString anchor = nearestExistingAncestor(cleaned);
    if (anchor.isEmpty()) return cleaned;
    const QString canonical = QFileInfo(anchor).canonicalFilePath();
    if (canonical.isEmpty()) return cleaned;
    const QString tail = cleaned.mid(anchor.size());
    return QDir::cleanPath(canonical + tail);
}

} // namespace FileUtils
