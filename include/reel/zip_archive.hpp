#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

namespace reel {

struct ZipEntry {
    QString name;
    QByteArray data;
};

// processed/total are uncompressed byte counts across every entry of the archive.
using ZipProgressFn = std::function<void(qint64 processed, qint64 total)>;

// Single-disk ZIP writer (no ZIP64). Entries are raw-deflated at the maximum level and stamped
// with a fixed DOS time so that identical input produces identical archives.
class ZipWriter {
public:
    static constexpr int kCompressionLevel = 9;
    static constexpr int kSliceBytes = 64 * 1024;

    void addFile(const QString& name, const QByteArray& data);
    [[nodiscard]] qint64 uncompressedSize() const;

    bool finish(QByteArray* archive, QString* error, const ZipProgressFn& progress = {}) const;

private:
    QList<ZipEntry> entries_;
};

class ZipReader {
public:
    static constexpr qint64 kMaxEntryBytes = 512LL * 1024 * 1024;

    bool load(const QByteArray& archive);
    [[nodiscard]] QString errorString() const { return error_; }

    [[nodiscard]] QStringList fileNames() const;
    [[nodiscard]] bool contains(const QString& name) const;
    [[nodiscard]] std::optional<QByteArray> file(const QString& name) const;

private:
    QList<ZipEntry> entries_;
    QString error_;
};

bool deflateRaw(
    const QByteArray& input,
    int level,
    QByteArray* output,
    QString* error,
    const std::function<void(qint64 consumed)>& onSlice = {});
bool inflateRaw(const QByteArray& input, qint64 expectedSize, QByteArray* output, QString* error);

}  // namespace reel
