#include "transfer_error.h"

QString TransferError::description() const
{
    switch (m_code) {
        case Code::None: return QStringLiteral("No error");
        case Code::FileNotFound: return QStringLiteral("File not found");
        case Code::DestinationNotWritable: return QStringLiteral("Destination is not writable");
        case Code::ChecksumMismatch: return QStringLiteral("Checksum verification failed");
        case Code::Cancelled: return QStringLiteral("Transfer was cancelled");
        case Code::SourcePathInvalid: return QStringLiteral("Source path is invalid");
        case Code::DestinationPathInvalid: return QStringLiteral("Destination path is invalid");
        case Code::PermissionDenied: return QStringLiteral("Permission denied for file access");
        case Code::CopyFailed:
            return m_detail.isEmpty() ? QStringLiteral("Copy failed")
                                      : QStringLiteral("Copy failed: %1").arg(m_detail);
    }
    return QString();
}

QString TransferError::failureReason() const
{
    switch (m_code) {
        case Code::None: return QString();
        case Code::FileNotFound:
            return QStringLiteral("The file could not be found at the specified location. Please verify the path.");
        case Code::DestinationNotWritable:
            return QStringLiteral("The destination location cannot be written to. Please check permissions or disk space.");
        case Code::ChecksumMismatch:
            return QStringLiteral("The file verification failed. The source and destination files do not match.");
        case Code::Cancelled:
            return QStringLiteral("The transfer was cancelled before it finished. Partially written files were removed.");
        case Code::SourcePathInvalid:
            return QStringLiteral("The source path does not exist or cannot be accessed.");
        case Code::DestinationPathInvalid:
            return QStringLiteral("The destination path does not exist or cannot be created.");
        case Code::PermissionDenied:
            return QStringLiteral("Access to the file was denied. Grant access to the volume and try again.");
        case Code::CopyFailed:
            return QStringLiteral("The copy operation failed: %1").arg(m_detail.isEmpty() ? QStringLiteral("unknown error") : m_detail);
    }
    return QString();
}

QString TransferError::toString() const
{
    if (m_code == Code::CopyFailed || m_detail.isEmpty()) return description();
    return QStringLiteral("%1 (%2)").arg(description(), m_detail);
}

QString TransferError::codeName(Code code)
{
    switch (code) {
        case Code::None: return QStringLiteral("None");
        case Code::FileNotFound: return QStringLiteral("FileNotFound");
        case Code::DestinationNotWritable: return QStringLiteral("DestinationNotWritable");
        case Code::ChecksumMismatch: return QStringLiteral("ChecksumMismatch");
        case Code::Cancelled: return QStringLiteral("Cancelled");
        case Code::SourcePathInvalid: return QStringLiteral("SourcePathInvalid");
        case Code::DestinationPathInvalid: return QStringLiteral("DestinationPathInvalid");
        case Code::PermissionDenied: return QStringLiteral("PermissionDenied");
        case Code::CopyFailed: return QStringLiteral("CopyFailed");
    }
    return QString();
}
