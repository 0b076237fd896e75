#include "TarFormat.hpp"
#include "core/common/Logger.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

namespace NoxJail {

namespace {

constexpr int kBlockSize = 512;
constexpr int kRecordSize = 20 * kBlockSize;
constexpr int kNameSize = 100;
constexpr int kPrefixSize = 155;

// ustar header layout
constexpr int kNameOffset = 0;
constexpr int kModeOffset = 100;
constexpr int kUidOffset = 108;
constexpr int kGidOffset = 116;
constexpr int kSizeOffset = 124;
constexpr int kMtimeOffset = 136;
constexpr int kChecksumOffset = 148;
constexpr int kTypeOffset = 156;
constexpr int kLinkOffset = 157;
constexpr int kMagicOffset = 257;
constexpr int kVersionOffset = 263;
constexpr int kPrefixOffset = 345;

constexpr const char* kLongLinkName = "././@LongLink";

qint64 paddedSize(qint64 size) {
    return (size + kBlockSize - 1) / kBlockSize * kBlockSize;
}

void putBytes(char* header, int offset, int width, const QByteArray& value) {
    std::memcpy(header + offset, value.constData(), std::min<qsizetype>(width, value.size()));
}

// Octal with a trailing NUL when the value fits, GNU base-256 otherwise.
void putNumeric(char* header, int offset, int width, qint64 value) {
    const qint64 octalLimit = qint64(1) << (3 * (width - 1));
    if (value >= 0 && value < octalLimit) {
        const QByteArray digits = QByteArray::number(value, 8).rightJustified(width - 1, '0');
        std::memcpy(header + offset, digits.constData(), width - 1);
        header[offset + width - 1] = '\0';
        return;
    }

    auto* field = reinterpret_cast<unsigned char*>(header + offset);
    auto remaining = static_cast<quint64>(value);
    for (int i = width - 1; i > 0; --i) {
        field[i] = static_cast<unsigned char>(remaining & 0xff);
        remaining >>= 8;
    }
    field[0] = 0x80;
}

qint64 parseNumeric(const char* field, int width) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(field);
    if (bytes[0] & 0x80) {
        if (bytes[0] == 0xff) {
            return -1;
        }
        quint64 value = bytes[0] & 0x7f;
        for (int i = 1; i < width; ++i) {
            if (value > (std::numeric_limits<quint64>::max() >> 8)) {
                return -1;
            }
            value = (value << 8) | bytes[i];
        }
        if (value > static_cast<quint64>(std::numeric_limits<qint64>::max())) {
            return -1;
        }
        return static_cast<qint64>(value);
    }

    int i = 0;
    while (i < width && (field[i] == ' ' || field[i] == '\0')) {
        ++i;
    }
    qint64 value = 0;
    for (; i < width; ++i) {
        const char c = field[i];
        if (c == ' ' || c == '\0') {
            break;
        }
        if (c < '0' || c > '7') {
            return -1;
        }
        value = value * 8 + (c - '0');
    }
    return value;
}

unsigned int unsignedChecksum(const char* header) {
    unsigned int sum = 0;
    for (int i = 0; i < kBlockSize; ++i) {
        const bool inField = i >= kChecksumOffset && i < kChecksumOffset + 8;
        sum += inField ? static_cast<unsigned int>(' ') : static_cast<unsigned char>(header[i]);
    }
    return sum;
}

// Some historic writers summed signed chars.
int signedChecksum(const char* header) {
    int sum = 0;
    for (int i = 0; i < kBlockSize; ++i) {
        const bool inField = i >= kChecksumOffset && i < kChecksumOffset + 8;
        sum += inField ? static_cast<int>(' ') : static_cast<signed char>(header[i]);
    }
    return sum;
}

bool checksumMatches(const char* header) {
    const qint64 stored = parseNumeric(header + kChecksumOffset, 8);
    if (stored < 0) {
        return false;
    }
    return stored == unsignedChecksum(header) || stored == signedChecksum(header);
}

bool isZeroBlock(const char* header) {
    return std::all_of(header, header + kBlockSize, [](char c) { return c == '\0'; });
}

QByteArray fieldBytes(const char* header, int offset, int width) {
    const char* start = header + offset;
    const auto* end = static_cast<const char*>(std::memchr(start, '\0', width));
    return QByteArray(start, end ? static_cast<int>(end - start) : width);
}

QByteArray nulTerminated(const QByteArray& payload) {
    const qsizetype nul = payload.indexOf('\0');
    return nul < 0 ? payload : payload.left(nul);
}

QString headerName(const char* header) {
    const QByteArray name = fieldBytes(header, kNameOffset, kNameSize);
    if (std::memcmp(header + kMagicOffset, "ustar", 5) == 0) {
        const QByteArray prefix = fieldBytes(header, kPrefixOffset, kPrefixSize);
        if (!prefix.isEmpty()) {
            return QString::fromUtf8(prefix + '/' + name);
        }
    }
    return QString::fromUtf8(name);
}

TarEntryType entryTypeFor(char typeFlag, const QString& name) {
    switch (typeFlag) {
    case '0':
    case '\0':
    case '7':
        return name.endsWith('/') ? TarEntryType::Directory : TarEntryType::Regular;
    case '1':
        return TarEntryType::HardLink;
    case '2':
        return TarEntryType::SymbolicLink;
    case '5':
        return TarEntryType::Directory;
    default:
        return TarEntryType::Unsupported;
    }
}

bool isMetadataType(char typeFlag) {
    return typeFlag == 'L' || typeFlag == 'K' || typeFlag == 'x' || typeFlag == 'g';
}

// "LEN key=value\n" records; only path, linkpath and size matter here.
void parsePaxRecords(const QByteArray& payload, QString& path, QString& linkPath, qint64& size) {
    qsizetype pos = 0;
    while (pos < payload.size()) {
        const qsizetype space = payload.indexOf(' ', pos);
        if (space < 0) {
            return;
        }
        bool ok = false;
        const qint64 length = payload.mid(pos, space - pos).toLongLong(&ok);
        if (!ok || length <= space - pos + 1 || pos + length > payload.size()) {
            return;
        }

        const QByteArray record = payload.mid(space + 1, pos + length - space - 2);
        const qsizetype equals = record.indexOf('=');
        if (equals > 0) {
            const QByteArray key = record.left(equals);
            const QByteArray value = record.mid(equals + 1);
            if (key == "path") {
                path = QString::fromUtf8(value);
            } else if (key == "linkpath") {
                linkPath = QString::fromUtf8(value);
            } else if (key == "size") {
                const qint64 parsed = value.toLongLong(&ok);
                if (ok && parsed >= 0) {
                    size = parsed;
                }
            }
        }
        pos += length;
    }
}

int splitPoint(const QByteArray& name) {
    for (int i = std::min<int>(kPrefixSize, static_cast<int>(name.size()) - 1); i > 0; --i) {
        const qsizetype tail = name.size() - i - 1;
        if (name.at(i) == '/' && tail > 0 && tail <= kNameSize) {
            return i;
        }
    }
    return -1;
}

} // namespace

void TarWriter::addFile(const QString& name, const QByteArray& data, int mode, qint64 modifiedTime) {
    TarEntry entry;
    entry.name = name;
    entry.data = data;
    entry.mode = mode;
    entry.modifiedTime = modifiedTime;
    addEntry(entry);
}

void TarWriter::addEntry(const TarEntry& entry) {
    QByteArray name = entry.name.toUtf8();
    char typeFlag = '0';
    qint64 size = 0;

    switch (entry.type) {
    case TarEntryType::Regular:
        typeFlag = '0';
        size = entry.data.size();
        break;
    case TarEntryType::HardLink:
        typeFlag = '1';
        break;
    case TarEntryType::SymbolicLink:
        typeFlag = '2';
        break;
    case TarEntryType::Directory:
        typeFlag = '5';
        if (!name.endsWith('/')) {
            name += '/';
        }
        break;
    case TarEntryType::Unsupported:
        typeFlag = entry.typeFlag;
        break;
    }

    writeHeader(name, entry.linkTarget.toUtf8(), typeFlag, size, entry.mode, entry.modifiedTime);
    if (size > 0) {
        writePadded(entry.data);
    }
    ++entryCount_;
}

QByteArray TarWriter::finish() {
    buffer_.append(QByteArray(2 * kBlockSize, '\0'));
    const qsizetype remainder = buffer_.size() % kRecordSize;
    if (remainder != 0) {
        buffer_.append(QByteArray(kRecordSize - remainder, '\0'));
    }

    QByteArray archive;
    archive.swap(buffer_);
    entryCount_ = 0;
    return archive;
}

void TarWriter::writeHeader(const QByteArray& name, const QByteArray& linkName,
                            char typeFlag, qint64 size, int mode, qint64 modifiedTime) {
    QByteArray storedName = name;
    QByteArray prefix;
    if (name.size() > kNameSize) {
        const int split = splitPoint(name);
        if (split > 0) {
            prefix = name.left(split);
            storedName = name.mid(split + 1);
        } else {
            writeLongNameRecord('L', name);
            storedName = name.left(kNameSize);
        }
    }

    QByteArray storedLink = linkName;
    if (linkName.size() > kNameSize) {
        writeLongNameRecord('K', linkName);
        storedLink = linkName.left(kNameSize);
    }

    QByteArray header(kBlockSize, '\0');
    char* h = header.data();
    putBytes(h, kNameOffset, kNameSize, storedName);
    putNumeric(h, kModeOffset, 8, mode & 07777);
    putNumeric(h, kUidOffset, 8, 0);
    putNumeric(h, kGidOffset, 8, 0);
    putNumeric(h, kSizeOffset, 12, size);
    putNumeric(h, kMtimeOffset, 12, std::max<qint64>(0, modifiedTime));
    h[kTypeOffset] = typeFlag;
    putBytes(h, kLinkOffset, kNameSize, storedLink);
    std::memcpy(h + kMagicOffset, "ustar", 6);
    std::memcpy(h + kVersionOffset, "00", 2);
    putBytes(h, kPrefixOffset, kPrefixSize, prefix);

    const QByteArray checksum = QByteArray::number(unsignedChecksum(h), 8).rightJustified(6, '0');
    std::memcpy(h + kChecksumOffset, checksum.constData(), 6);
    h[kChecksumOffset + 6] = '\0';
    h[kChecksumOffset + 7] = ' ';

    buffer_.append(header);
}

void TarWriter::writeLongNameRecord(char typeFlag, const QByteArray& value) {
    QByteArray payload = value;
    payload.append('\0');
    writeHeader(kLongLinkName, QByteArray(), typeFlag, payload.size(), 0644, 0);
    writePadded(payload);
}

void TarWriter::writePadded(const QByteArray& payload) {
    buffer_.append(payload);
    const qint64 padding = paddedSize(payload.size()) - payload.size();
    if (padding > 0) {
        buffer_.append(QByteArray(static_cast<int>(padding), '\0'));
    }
}

Expected<TarParseResult, ArchiveError> TarReader::parse(const QByteArray& data, int maxMembers) {
    TarParseResult result;
    if (data.isEmpty()) {
        return result;
    }

    qsizetype offset = 0;
    bool sawHeader = false;
    bool sawEndMarker = false;

    QByteArray longName;
    QByteArray longLink;
    QString paxPath;
    QString paxLinkPath;
    qint64 paxSize = -1;

    while (offset + kBlockSize <= data.size()) {
        const char* header = data.constData() + offset;
        if (isZeroBlock(header)) {
            sawEndMarker = true;
            break;
        }

        const char typeFlag = header[kTypeOffset];
        qint64 size = parseNumeric(header + kSizeOffset, 12);
        if (paxSize >= 0 && !isMetadataType(typeFlag)) {
            size = paxSize;
        }

        if (!checksumMatches(header) || size < 0) {
            if (!sawHeader) {
                NOXJAIL_WARN("Data does not start with a valid tar header");
                return makeUnexpected(ArchiveError::MalformedArchive);
            }
            NOXJAIL_WARN("Corrupt tar header at offset {}, ignoring the rest of the archive", offset);
            break;
        }
        sawHeader = true;
        offset += kBlockSize;

        if (size > data.size() - offset) {
            NOXJAIL_WARN("Tar member at offset {} is truncated", offset - kBlockSize);
            break;
        }
        const QByteArray payload = data.mid(offset, size);
        offset += paddedSize(size);

        switch (typeFlag) {
        case 'L':
            longName = nulTerminated(payload);
            continue;
        case 'K':
            longLink = nulTerminated(payload);
            continue;
        case 'x':
            parsePaxRecords(payload, paxPath, paxLinkPath, paxSize);
            continue;
        case 'g':
            continue;
        default:
            break;
        }

        TarEntry entry;
        if (!paxPath.isEmpty()) {
            entry.name = paxPath;
        } else if (!longName.isEmpty()) {
            entry.name = QString::fromUtf8(longName);
        } else {
            entry.name = headerName(header);
        }
        if (!paxLinkPath.isEmpty()) {
            entry.linkTarget = paxLinkPath;
        } else if (!longLink.isEmpty()) {
            entry.linkTarget = QString::fromUtf8(longLink);
        } else {
            entry.linkTarget = QString::fromUtf8(fieldBytes(header, kLinkOffset, kNameSize));
        }
        entry.typeFlag = typeFlag;
        entry.type = entryTypeFor(typeFlag, entry.name);
        const qint64 mode = parseNumeric(header + kModeOffset, 8);
        entry.mode = mode >= 0 ? static_cast<int>(mode & 07777) : 0644;
        entry.modifiedTime = std::max<qint64>(0, parseNumeric(header + kMtimeOffset, 12));
        if (entry.type == TarEntryType::Regular) {
            entry.data = payload;
        }

        longName.clear();
        longLink.clear();
        paxPath.clear();
        paxLinkPath.clear();
        paxSize = -1;

        if (result.entries.size() >= maxMembers) {
            result.limitExceeded = true;
            result.firstSkippedName = entry.name;
            NOXJAIL_WARN("Archive has more than {} members, ignoring the rest", maxMembers);
            break;
        }
        result.entries.append(entry);
    }

    if (!sawHeader && !sawEndMarker) {
        NOXJAIL_WARN("Data is too short to be a tar archive");
        return makeUnexpected(ArchiveError::MalformedArchive);
    }
    return result;
}

} // namespace NoxJail
