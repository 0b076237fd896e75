#include "GzipCodec.hpp"
#include "core/common/Logger.hpp"

#include <zlib.h>
#include <limits>

namespace NoxJail {

namespace {

constexpr int kChunkSize = 64 * 1024;
constexpr int kGzipWindowBits = 15 + 16;

Bytef* inputBytes(const QByteArray& data) {
    return reinterpret_cast<Bytef*>(const_cast<char*>(data.constData()));
}

} // namespace

bool GzipCodec::isGzip(const QByteArray& data) {
    return data.size() >= 2
        && static_cast<unsigned char>(data.at(0)) == 0x1f
        && static_cast<unsigned char>(data.at(1)) == 0x8b;
}

Expected<QByteArray, ArchiveError> GzipCodec::compress(const QByteArray& data, int level) {
    if (data.size() > static_cast<qsizetype>(std::numeric_limits<uInt>::max())) {
        NOXJAIL_ERROR("Refusing to compress {} bytes in a single stream", data.size());
        return makeUnexpected(ArchiveError::CompressionFailed);
    }

    z_stream stream{};
    if (deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        NOXJAIL_ERROR("deflateInit2 failed: {}", stream.msg ? stream.msg : "unknown");
        return makeUnexpected(ArchiveError::CompressionFailed);
    }

    stream.next_in = inputBytes(data);
    stream.avail_in = static_cast<uInt>(data.size());

    QByteArray output;
    QByteArray chunk(kChunkSize, Qt::Uninitialized);
    int status = Z_OK;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = kChunkSize;
        status = deflate(&stream, Z_FINISH);
        if (status == Z_STREAM_ERROR) {
            deflateEnd(&stream);
            NOXJAIL_ERROR("deflate failed");
            return makeUnexpected(ArchiveError::CompressionFailed);
        }
        output.append(chunk.constData(), kChunkSize - static_cast<int>(stream.avail_out));
    } while (status != Z_STREAM_END);

    deflateEnd(&stream);
    return output;
}

Expected<QByteArray, ArchiveError> GzipCodec::decompress(const QByteArray& data, qint64 maxOutputBytes) {
    if (data.size() > static_cast<qsizetype>(std::numeric_limits<uInt>::max())) {
        return makeUnexpected(ArchiveError::ArchiveTooLarge);
    }

    z_stream stream{};
    if (inflateInit2(&stream, kGzipWindowBits) != Z_OK) {
        NOXJAIL_ERROR("inflateInit2 failed: {}", stream.msg ? stream.msg : "unknown");
        return makeUnexpected(ArchiveError::DecompressionFailed);
    }

    stream.next_in = inputBytes(data);
    stream.avail_in = static_cast<uInt>(data.size());

    QByteArray output;
    QByteArray chunk(kChunkSize, Qt::Uninitialized);
    for (;;) {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = kChunkSize;
        const int status = inflate(&stream, Z_NO_FLUSH);

        if (status == Z_NEED_DICT || status == Z_DATA_ERROR
            || status == Z_MEM_ERROR || status == Z_STREAM_ERROR) {
            NOXJAIL_WARN("inflate failed: {}", stream.msg ? stream.msg : "corrupt stream");
            inflateEnd(&stream);
            return makeUnexpected(ArchiveError::DecompressionFailed);
        }

        const int produced = kChunkSize - static_cast<int>(stream.avail_out);
        if (output.size() + produced > maxOutputBytes) {
            NOXJAIL_WARN("Archive inflates beyond the {} byte limit", maxOutputBytes);
            inflateEnd(&stream);
            return makeUnexpected(ArchiveError::ArchiveTooLarge);
        }
        output.append(chunk.constData(), produced);

        if (status == Z_STREAM_END) {
            const qsizetype consumed = data.size() - static_cast<qsizetype>(stream.avail_in);
            if (stream.avail_in > 0 && isGzip(data.mid(consumed, 2))) {
                inflateReset(&stream);
                continue;
            }
            break;
        }

        if (status == Z_BUF_ERROR || (stream.avail_in == 0 && stream.avail_out != 0)) {
            NOXJAIL_WARN("gzip stream is truncated");
            inflateEnd(&stream);
            return makeUnexpected(ArchiveError::DecompressionFailed);
        }
    }

    inflateEnd(&stream);
    return output;
}

} // namespace NoxJail
