#pragma once

#include <QString>
#include <QStringList>

#include "transfer_types.h"

// Renders a validated request into copy-tool launches. Pure: no filesystem access,
// identical inputs always give an identical Invocation (the preview shown to the
// user is exactly what runs).
class CommandBuilder {
public:
    static constexpr int kMinThreads = 1;
    static constexpr int kMaxThreads = 128; // Robocopy /MT limit

    // Option checks that need no I/O. Mirror without subfolders is rejected here.
    static bool validate(const TransferRequest& request, TransferFailure* failure = nullptr);

    // Every collision in report must have an action in resolution, otherwise UnresolvedCollision.
    static bool build(const QString& program, const TransferRequest& request, const PreflightReport& report,
                      const DuplicateResolution& resolution, Invocation& out, TransferFailure* failure = nullptr);

    static QString quoteArgument(const QString& arg);
    static QString renderCommandLine(const QString& program, const QStringList& arguments);
    static QString renderPreview(const Invocation& invocation);

private:
    static QStringList optionFlags(const TransferRequest& request, bool directoryStep, bool overwrite,
                                   const QStringList& excludes);
};
