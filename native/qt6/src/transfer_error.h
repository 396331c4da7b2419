#pragma once
#include <QString>
#include <QMetaType>

// Closed set of failures a transfer can end with.
class TransferError {
public:
    enum class Code {
        None,
        FileNotFound,
        DestinationNotWritable,
        ChecksumMismatch,
        Cancelled,
        SourcePathInvalid,
        DestinationPathInvalid,
        PermissionDenied,
        CopyFailed
    };

    TransferError() = default;
    explicit TransferError(Code code, const QString& detail = QString()) : m_code(code), m_detail(detail) {}

    static TransferError copyFailed(const QString& detail) { return TransferError(Code::CopyFailed, detail); }

    Code code() const { return m_code; }
    QString detail() const { return m_detail; }
    bool isError() const { return m_code != Code::None; }

    // Short text for status lines, e.g. "Checksum verification failed"
    QString description() const;
    // Longer explanation suitable for an error dialog
    QString failureReason() const;
    // description() plus the detail when there is one
    QString toString() const;

    static QString codeName(Code code);

    bool operator==(const TransferError& other) const { return m_code == other.m_code; }
    bool operator!=(const TransferError& other) const { return m_code != other.m_code; }

private:
    Code m_code = Code::None;
    QString m_detail;
};

Q_DECLARE_METATYPE(TransferError)
