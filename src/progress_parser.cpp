#include "progress_parser.h"

#include <QStringList>
#include <cmath>

namespace {
// Operation prefixes robocopy puts between "ERROR n (0x...)" and the path.
const char* const kErrorOperations[] = {
    "Copying File",
    "Copying NTFS Security to Destination File",
    "Changing File Attributes",
    "Deleting Extra File",
    "Deleting Extra Directory",
    "Moving File",
    "Creating Destination Directory",
    "Accessing Source Directory",
    "Accessing Destination Directory",
    "Scanning Source Directory",
    "Scanning Destination Directory",
    "Opening Log File",
    "Retrieving Security Information",
};
}

const QRegularExpression& ProgressParser::fileLinePattern()
{
    // "    New File  \t\t  1048576\tC:\src\clip.mov"
    static const QRegularExpression re(
        "^\\s*(New File|Newer|Older|Changed|Tweaked|Same|Modified)\\s+(\\S+)(?:\\s([kmgtKMGT]))?\\s+(\\S.*?)\\s*$");
    return re;
}

const QRegularExpression& ProgressParser::percentPattern()
{
    static const QRegularExpression re("^\\s*(\\d{1,3}(?:\\.\\d+)?)\\s*%\\s*$");
    return re;
}

const QRegularExpression& ProgressParser::errorPattern()
{
    // "2024/05/01 10:00:00 ERROR 5 (0x00000005) Copying File C:\src\clip.mov"
    static const QRegularExpression re("\\bERROR\\s+(\\d+)\\s+\\(0x([0-9A-Fa-f]+)\\)\\s*(.*?)\\s*$");
    return re;
}

const QRegularExpression& ProgressParser::parameterErrorPattern()
{
    // "ERROR : Invalid Parameter #3 : "/BAD""
    static const QRegularExpression re("^\\s*ERROR\\s*:\\s*(.+?)\\s*$");
    return re;
}

const QRegularExpression& ProgressParser::toolRetryPattern()
{
    static const QRegularExpression re("Waiting\\s+(\\d+)\\s+seconds\\.*\\s*Retrying", QRegularExpression::CaseInsensitiveOption);
    return re;
}

const QRegularExpression& ProgressParser::summaryPattern()
{
    static const QRegularExpression re("^\\s*(Files|Bytes)\\s*:\\s*(.*?)\\s*$");
    return re;
}

qint64 ProgressParser::parseSize(const QString& number, const QString& unit)
{
    bool ok = false;
    const double value = number.toDouble(&ok);
    if (!ok || !std::isfinite(value) || value < 0.0) return -1;

    double multiplier = 1.0;
    if (!unit.isEmpty()) {
        switch (unit.at(0).toLower().toLatin1()) {
            case 'k': multiplier = 1024.0; break;
            case 'm': multiplier = 1024.0 * 1024.0; break;
            case 'g': multiplier = 1024.0 * 1024.0 * 1024.0; break;
            case 't': multiplier = 1024.0 * 1024.0 * 1024.0 * 1024.0; break;
            default: return -1;
        }
    }
    const double bytes = value * multiplier;
    if (bytes > 9.0e18) return -1;
    return qint64(std::llround(bytes));
}

std::optional<ProgressEvent> ProgressParser::parse(const QString& line)
{
    if (line.trimmed().isEmpty()) return std::nullopt;

    QRegularExpressionMatch m = percentPattern().match(line);
    if (m.hasMatch()) {
        bool ok = false;
        const double pct = m.captured(1).toDouble(&ok);
        if (!ok || pct < 0.0 || pct > 100.0) return std::nullopt;
        return ProgressEvent::fileProgress(pct);
    }

    m = fileLinePattern().match(line);
    if (m.hasMatch()) return parseFileLine(m);

    m = errorPattern().match(line);
    if (m.hasMatch()) return parseError(m);

    m = parameterErrorPattern().match(line);
    if (m.hasMatch()) return ProgressEvent::fileError(QString(), 0, m.captured(1));

    m = toolRetryPattern().match(line);
    if (m.hasMatch()) {
        bool ok = false;
        const int secs = m.captured(1).toInt(&ok);
        if (!ok) return std::nullopt;
        return ProgressEvent::toolRetrying(secs);
    }

    m = summaryPattern().match(line);
    if (m.hasMatch()) return parseSummary(m);

    return std::nullopt;
}

std::optional<ProgressEvent> ProgressParser::parseFileLine(const QRegularExpressionMatch& m)
{
    const QString fileClass = m.captured(1);
    const QString name = m.captured(4);
    if (name.isEmpty()) return std::nullopt;
    // An unreadable size still tells us which file is in flight.
    const qint64 size = parseSize(m.captured(2), m.captured(3));
    return ProgressEvent::fileStarted(name, size, fileClass);
}

std::optional<ProgressEvent> ProgressParser::parseError(const QRegularExpressionMatch& m)
{
    bool ok = false;
    int code = m.captured(1).toInt(&ok);
    if (!ok) {
        code = int(m.captured(2).toUInt(&ok, 16));
        if (!ok) code = 0;
    }

    const QString rest = m.captured(3);
    QString operation;
    QString path = rest;
    for (const char* op : kErrorOperations) {
        const QString prefix = QString::fromLatin1(op);
        if (rest.startsWith(prefix + ' ')) {
            operation = prefix;
            path = rest.mid(prefix.size() + 1).trimmed();
            break;
        }
    }
    const QString message = operation.isEmpty() ? rest : operation;
    return ProgressEvent::fileError(path, code, message);
}

std::optional<ProgressEvent> ProgressParser::parseSummary(const QRegularExpressionMatch& m)
{
    const ProgressEvent::SummaryRow row = m.captured(1) == QLatin1String("Files")
        ? ProgressEvent::SummaryRow::Files : ProgressEvent::SummaryRow::Bytes;

    static const QRegularExpression ws("\\s+");
    static const QRegularExpression unitToken("^[kmgtKMGT]$");
    const QStringList tokens = m.captured(2).split(ws, Qt::SkipEmptyParts);

    QVector<qint64> values;
    for (int i = 0; i < tokens.size(); ++i) {
        QString unit;
        if (i + 1 < tokens.size() && unitToken.match(tokens[i + 1]).hasMatch()) unit = tokens[i + 1];
        const qint64 v = parseSize(tokens[i], unit);
        // The job header also has a "Files : *.*" row; anything non-numeric is not the summary.
        if (v < 0) return std::nullopt;
        values << v;
        if (!unit.isEmpty()) ++i;
    }
    if (values.size() != 6) return std::nullopt;

    SummaryCounts c;
    c.total = values[0];
    c.copied = values[1];
    c.skipped = values[2];
    c.mismatch = values[3];
    c.failed = values[4];
    c.extras = values[5];
    return ProgressEvent::summary(row, c);
}
