#pragma once

#include <QHash>
#include <QString>

// Maps a copy-tool exit code to how the supervisor reacts to it.
// Robocopy reports a bit field: 1 copied, 2 extras, 4 mismatches, 8 failures, 16 fatal.
class ExitCodeClassifier {
public:
    enum class Category { Success, Warning, Transient, Fatal, Unknown };

    ExitCodeClassifier() = default;

    // 0-1 success, 2-7 warning, 8-15 transient, 16-31 fatal, anything else unknown.
    static ExitCodeClassifier robocopyDefault();

    Category classify(int exitCode) const;
    QString describe(int exitCode) const;

    void setCategory(int exitCode, Category category) { m_table.insert(exitCode, category); }
    void clear() { m_table.clear(); }

    static QString categoryName(Category category);

private:
    QHash<int, Category> m_table;
};
