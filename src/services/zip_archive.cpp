#include "reel/zip_archive.hpp"

#include <QBuffer>
#include <QDataStream>

#include <zlib.h>

#include <algorithm>
#include <limits>

#include "reel/logging.hpp"

namespace reel {

namespace {

constexpr quint32 kLocalHeaderSignature = 0x04034b50;
constexpr quint32 kCentralHeaderSignature = 0x02014b50;
constexpr quint32 kEndOfCentralSignature = 0x06054b50;
constexpr quint16 kVersion = 20;
constexpr quint16 kUtf8NameFlag = 0x0800;
constexpr quint16 kMethodStored = 0;
constexpr quint16 kMethodDeflate = 8;
// 1980-01-01 00:00:00, the DOS epoch.
constexpr quint16 kDosTime = 0;
constexpr quint16 kDosDate = (1 << 5) | 1;
constexpr int kLocalHeaderSize = 30;
constexpr int kCentralHeaderSize = 46;
constexpr int kEndOfCentralSize = 22;
constexpr int kChunkBytes = 256 * 1024;

quint32 checksum(const QByteArray& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    const auto* bytes = reinterpret_cast<const Bytef*>(data.constData());
    qint64 remaining = data.size();
    while (remaining > 0) {
        const uInt step = static_cast<uInt>(std::min<qint64>(remaining, std::numeric_limits<uInt>::max()));
        crc = crc32(crc, bytes, step);
        bytes += step;
        remaining -= step;
    }
    return static_cast<quint32>(crc);
}

quint16 readU16(const QByteArray& data, qint64 offset) {
    const auto* p = reinterpret_cast<const uchar*>(data.constData() + offset);
    return static_cast<quint16>(p[0] | (p[1] << 8));
}

quint32 readU32(const QByteArray& data, qint64 offset) {
    const auto* p = reinterpret_cast<const uchar*>(data.constData() + offset);
    return static_cast<quint32>(p[0]) | (static_cast<quint32>(p[1]) << 8)
        | (static_cast<quint32>(p[2]) << 16) | (static_cast<quint32>(p[3]) << 24);
}

struct CentralRecord {
    QByteArray name;
    quint32 crc = 0;
    quint32 compressedSize = 0;
    quint32 size = 0;
    quint32 localOffset = 0;
};

}  // namespace

bool deflateRaw(
    const QByteArray& input,
    int level,
    QByteArray* output,
    QString* error,
    const std::function<void(qint64 consumed)>& onSlice) {
    z_stream zs{};
    // Negative window bits: raw deflate, no zlib header or trailer.
    int rc = deflateInit2(&zs, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        *error = QString("deflateInit2 failed (%1)").arg(rc);
        return false;
    }

    output->clear();
    QByteArray chunk(kChunkBytes, Qt::Uninitialized);
    const auto* source = reinterpret_cast<const Bytef*>(input.constData());
    qint64 consumed = 0;
    bool ok = true;

    for (;;) {
        const qint64 slice = std::min<qint64>(input.size() - consumed, ZipWriter::kSliceBytes);
        zs.next_in = const_cast<Bytef*>(source + consumed);
        zs.avail_in = static_cast<uInt>(slice);
        const int flush = (consumed + slice >= input.size()) ? Z_FINISH : Z_NO_FLUSH;

        do {
            zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
            zs.avail_out = static_cast<uInt>(chunk.size());
            rc = deflate(&zs, flush);
            if (rc == Z_STREAM_ERROR) {
                ok = false;
                break;
            }
            output->append(chunk.constData(), chunk.size() - static_cast<int>(zs.avail_out));
        } while (zs.avail_out == 0);

        consumed += slice;
        if (ok && onSlice) {
            onSlice(consumed);
        }
        if (!ok || flush == Z_FINISH) {
            break;
        }
    }

    deflateEnd(&zs);
    if (!ok || rc != Z_STREAM_END) {
        *error = QString("deflate failed (%1)").arg(rc);
        output->clear();
        return false;
    }
    return true;
}

bool inflateRaw(const QByteArray& input, qint64 expectedSize, QByteArray* output, QString* error) {
    z_stream zs{};
    int rc = inflateInit2(&zs, -MAX_WBITS);
    if (rc != Z_OK) {
        *error = QString("inflateInit2 failed (%1)").arg(rc);
        return false;
    }

    output->clear();
    output->reserve(static_cast<int>(expectedSize));
    QByteArray chunk(kChunkBytes, Qt::Uninitialized);
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.constData()));
    zs.avail_in = static_cast<uInt>(input.size());

    do {
        zs.next_out = reinterpret_cast<Bytef*>(chunk.data());
        zs.avail_out = static_cast<uInt>(chunk.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
            break;
        }
        output->append(chunk.constData(), chunk.size() - static_cast<int>(zs.avail_out));
        if (output->size() > expectedSize) {
            rc = Z_DATA_ERROR;
            break;
        }
        if (rc == Z_BUF_ERROR && zs.avail_in == 0) {
            break;
        }
    } while (rc != Z_STREAM_END);

    inflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        *error = QString("inflate failed (%1)").arg(rc);
        output->clear();
        return false;
    }
    return true;
}

void ZipWriter::addFile(const QString& name, const QByteArray& data) {
    entries_.append({name, data});
}

qint64 ZipWriter::uncompressedSize() const {
    qint64 total = 0;
    for (const ZipEntry& entry : entries_) {
        total += entry.data.size();
    }
    return total;
}

bool ZipWriter::finish(QByteArray* archive, QString* error, const ZipProgressFn& progress) const {
    const qint64 total = uncompressedSize();
    qint64 processedBefore = 0;

    QByteArray out;
    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    QDataStream stream(&buffer);
    stream.setByteOrder(QDataStream::LittleEndian);

    QList<CentralRecord> central;
    for (const ZipEntry& entry : entries_) {
        if (entry.data.size() >= std::numeric_limits<quint32>::max()) {
            *error = QString("%1 exceeds the 4 GiB ZIP entry limit").arg(entry.name);
            return false;
        }

        QByteArray compressed;
        QString deflateError;
        const bool deflated = deflateRaw(entry.data, kCompressionLevel, &compressed, &deflateError,
            [&](qint64 consumed) {
                if (progress) {
                    progress(processedBefore + consumed, total);
                }
            });
        if (!deflated) {
            *error = QString("%1: %2").arg(entry.name, deflateError);
            return false;
        }
        processedBefore += entry.data.size();

        CentralRecord record;
        record.name = entry.name.toUtf8();
        record.crc = checksum(entry.data);
        record.compressedSize = static_cast<quint32>(compressed.size());
        record.size = static_cast<quint32>(entry.data.size());
        record.localOffset = static_cast<quint32>(buffer.pos());

        stream << kLocalHeaderSignature << kVersion << kUtf8NameFlag << kMethodDeflate
               << kDosTime << kDosDate << record.crc << record.compressedSize << record.size
               << static_cast<quint16>(record.name.size()) << static_cast<quint16>(0);
        stream.writeRawData(record.name.constData(), record.name.size());
        stream.writeRawData(compressed.constData(), compressed.size());
        central.append(record);
    }

    const quint32 centralOffset = static_cast<quint32>(buffer.pos());
    for (const CentralRecord& record : central) {
        stream << kCentralHeaderSignature << kVersion << kVersion << kUtf8NameFlag << kMethodDeflate
               << kDosTime << kDosDate << record.crc << record.compressedSize << record.size
               << static_cast<quint16>(record.name.size())
               << static_cast<quint16>(0)  // extra
               << static_cast<quint16>(0)  // comment
               << static_cast<quint16>(0)  // disk
               << static_cast<quint16>(0)  // internal attributes
               << static_cast<quint32>(0)  // external attributes
               << record.localOffset;
        stream.writeRawData(record.name.constData(), record.name.size());
    }
    const quint32 centralSize = static_cast<quint32>(buffer.pos()) - centralOffset;

    stream << kEndOfCentralSignature << static_cast<quint16>(0) << static_cast<quint16>(0)
           << static_cast<quint16>(central.size()) << static_cast<quint16>(central.size())
           << centralSize << centralOffset << static_cast<quint16>(0);

    if (stream.status() != QDataStream::Ok) {
        *error = "Failed to write archive stream";
        return false;
    }
    if (progress && total == 0) {
        progress(0, 0);
    }
    buffer.close();
    *archive = out;
    return true;
}

bool ZipReader::load(const QByteArray& archive) {
    entries_.clear();
    error_.clear();

    if (archive.size() < kEndOfCentralSize) {
        error_ = "Archive is too small to be a ZIP file";
        return false;
    }

    qint64 eocd = -1;
    const qint64 earliest = std::max<qint64>(0, archive.size() - kEndOfCentralSize - 0xFFFF);
    for (qint64 pos = archive.size() - kEndOfCentralSize; pos >= earliest; --pos) {
        if (readU32(archive, pos) == kEndOfCentralSignature) {
            eocd = pos;
            break;
        }
    }
    if (eocd < 0) {
        error_ = "End of central directory record not found";
        return false;
    }

    const int count = readU16(archive, eocd + 10);
    const qint64 centralSize = readU32(archive, eocd + 12);
    qint64 offset = readU32(archive, eocd + 16);
    if (offset + centralSize > eocd) {
        error_ = "Central directory lies outside the archive";
        return false;
    }

    for (int i = 0; i < count; ++i) {
        if (offset + kCentralHeaderSize > eocd || readU32(archive, offset) != kCentralHeaderSignature) {
            error_ = QString("Corrupt central directory entry %1").arg(i);
            return false;
        }
        const quint16 method = readU16(archive, offset + 10);
        const quint32 crc = readU32(archive, offset + 16);
        const qint64 compressedSize = readU32(archive, offset + 20);
        const qint64 size = readU32(archive, offset + 24);
        const int nameLength = readU16(archive, offset + 28);
        const int extraLength = readU16(archive, offset + 30);
        const int commentLength = readU16(archive, offset + 32);
        const qint64 localOffset = readU32(archive, offset + 42);
        const QString name = QString::fromUtf8(archive.mid(offset + kCentralHeaderSize, nameLength));
        offset += kCentralHeaderSize + nameLength + extraLength + commentLength;

        if (localOffset + kLocalHeaderSize > archive.size()
            || readU32(archive, localOffset) != kLocalHeaderSignature) {
            error_ = QString("Corrupt local header for %1").arg(name);
            return false;
        }
        const qint64 dataOffset = localOffset + kLocalHeaderSize
            + readU16(archive, localOffset + 26) + readU16(archive, localOffset + 28);
        if (dataOffset + compressedSize > archive.size()) {
            error_ = QString("Truncated data for %1").arg(name);
            return false;
        }
        if (size > kMaxEntryBytes) {
            error_ = QString("%1 is too large to extract (%2 bytes)").arg(name).arg(size);
            return false;
        }

        const QByteArray raw = archive.mid(dataOffset, compressedSize);
        QByteArray data;
        if (method == kMethodStored) {
            data = raw;
        } else if (method == kMethodDeflate) {
            QString inflateError;
            if (!inflateRaw(raw, size, &data, &inflateError)) {
                error_ = QString("%1: %2").arg(name, inflateError);
                return false;
            }
        } else {
            error_ = QString("%1 uses unsupported compression method %2").arg(name).arg(method);
            return false;
        }

        if (data.size() != size || checksum(data) != crc) {
            error_ = QString("Checksum mismatch for %1").arg(name);
            return false;
        }
        entries_.append({name, data});
    }

    qCDebug(lcStore) << "zip archive loaded with" << entries_.size() << "entries";
    return true;
}

QStringList ZipReader::fileNames() const {
    QStringList names;
    for (const ZipEntry& entry : entries_) {
        names.append(entry.name);
    }
    return names;
}

bool ZipReader::contains(const QString& name) const {
    return file(name).has_value();
}

std::optional<QByteArray> ZipReader::file(const QString& name) const {
    for (const ZipEntry& entry : entries_) {
        if (entry.name == name) {
            return entry.data;
        }
    }
    return std::nullopt;
}

}  // namespace reel
