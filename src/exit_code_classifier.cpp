#include "exit_code_classifier.h"

#include <QStringList>

ExitCodeClassifier ExitCodeClassifier::robocopyDefault()
{
    ExitCodeClassifier c;
    c.setCategory(0, Category::Success);
    c.setCategory(1, Category::Success);
    for (int code = 2; code <= 7; ++code) c.setCategory(code, Category::Warning);
    for (int code = 8; code <= 15; ++code) c.setCategory(code, Category::Transient);
    for (int code = 16; code <= 31; ++code) c.setCategory(code, Category::Fatal);
    return c;
}

ExitCodeClassifier::Category ExitCodeClassifier::classify(int exitCode) const
{
    return m_table.value(exitCode, Category::Unknown);
}

QString ExitCodeClassifier::describe(int exitCode) const
{
    if (exitCode < 0 || exitCode > 31) return QString("unrecognised exit code %1").arg(exitCode);
    if (exitCode == 0) return QStringLiteral("no files needed copying");

    QStringList parts;
    if (exitCode & 16) parts << QStringLiteral("serious error, no files were copied");
    if (exitCode & 8) parts << QStringLiteral("some files or directories could not be copied");
    if (exitCode & 4) parts << QStringLiteral("mismatched files or directories detected");
    if (exitCode & 2) parts << QStringLiteral("extra files or directories detected");
    if (exitCode & 1) parts << QStringLiteral("files copied");
    return parts.join(QStringLiteral("; "));
}

QString ExitCodeClassifier::categoryName(Category category)
{
    switch (category) {
        case Category::Success: return "Success";
        case Category::Warning: return "Warning";
        case Category::Transient: return "Transient";
        case Category::Fatal: return "Fatal";
        case Category::Unknown: return "Unknown";
    }
    return QString();
}
