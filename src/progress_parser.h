#pragma once

#include <QString>
#include <QRegularExpression>
#include <optional>

#include "transfer_types.h"

// Turns one line of copy-tool output into a progress event.
// Stateless: the caller tracks the current file and converts FileProgress into BytesCopied.
// Unrecognised or malformed lines yield std::nullopt, never an error.
class ProgressParser {
public:
    static std::optional<ProgressEvent> parse(const QString& line);

    // "1048576", "10.5 m", "3 g" -> bytes; -1 when the token is not a size.
    static qint64 parseSize(const QString& number, const QString& unit = QString());

    // Centralized patterns
    static const QRegularExpression& fileLinePattern();
    static const QRegularExpression& percentPattern();
    static const QRegularExpression& errorPattern();
    static const QRegularExpression& parameterErrorPattern();
    static const QRegularExpression& toolRetryPattern();
    static const QRegularExpression& summaryPattern();

private:
    static std::optional<ProgressEvent> parseFileLine(const QRegularExpressionMatch& m);
    static std::optional<ProgressEvent> parseError(const QRegularExpressionMatch& m);
    static std::optional<ProgressEvent> parseSummary(const QRegularExpressionMatch& m);
};
