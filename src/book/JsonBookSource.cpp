#include "JsonBookSource.h"
#include "Log.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QUrl>

namespace {

constexpr double TimestampTolerance = 1e-6;

// Relative audio paths are resolved against the book file's directory.
QString resolveAudioUrl(const QString& audioUrl, const QString& baseDir) {
    if (audioUrl.isEmpty()) return audioUrl;
    QUrl url(audioUrl);
    if (url.isValid() && !url.scheme().isEmpty() && url.scheme().length() > 1) {
        return audioUrl;
    }
    if (QFileInfo(audioUrl).isAbsolute() || baseDir.isEmpty()) {
        return audioUrl;
    }
    return QDir(baseDir).filePath(audioUrl);
}

} // namespace

JsonBookSource::JsonBookSource(const QString& path, QObject* parent)
    : QObject(parent), m_path(path) {}

JsonBookSource::~JsonBookSource() = default;

bool JsonBookSource::readDocument(const QString& filePath, QJsonObject& root) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        m_error = QString("Invalid book file %1: %2").arg(filePath, parseError.errorString());
        return false;
    }
    root = doc.object();
    return true;
}

bool JsonBookSource::loadBook(qint64 bookId, BookData& book) {
    QFileInfo info(m_path);
    QString filePath = m_path;
    if (info.isDir()) {
        filePath = QDir(m_path).filePath(QString("%1.json").arg(bookId));
    }

    if (!QFileInfo::exists(filePath)) {
        m_error = QString("Book %1 not found").arg(bookId);
        return false;
    }

    QJsonObject root;
    if (!readDocument(filePath, root)) {
        return false;
    }

    BookData parsed;
    QString error;
    if (!bookFromJson(root, parsed, &error)) {
        m_error = QString("Book %1: %2").arg(bookId).arg(error);
        return false;
    }

    if (root.contains("id") && parsed.id != bookId) {
        m_error = QString("Book %1 not found").arg(bookId);
        return false;
    }
    parsed.id = bookId;

    const QString baseDir = QFileInfo(filePath).absolutePath();
    for (auto& chapter : parsed.chapters) {
        chapter.audioUrl = resolveAudioUrl(chapter.audioUrl, baseDir);
    }

    qCDebug(lcExport) << "Loaded book" << bookId << "with" << parsed.chapters.size()
                      << "chapters from" << filePath;
    book = std::move(parsed);
    return true;
}

QList<qint64> JsonBookSource::availableBookIds() const {
    QList<qint64> ids;
    QFileInfo info(m_path);
    if (info.isDir()) {
        const QStringList files = QDir(m_path).entryList({"*.json"}, QDir::Files, QDir::Name);
        for (const QString& name : files) {
            bool ok = false;
            qint64 id = QFileInfo(name).completeBaseName().toLongLong(&ok);
            if (ok) ids.append(id);
        }
        return ids;
    }

    QFile file(m_path);
    if (file.open(QIODevice::ReadOnly)) {
        QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
        if (doc.isObject() && doc.object().contains("id")) {
            ids.append(doc.object()["id"].toVariant().toLongLong());
        }
    }
    return ids;
}

bool JsonBookSource::bookFromJson(const QJsonObject& obj, BookData& book, QString* error) {
    book = BookData{};
    book.id = obj["id"].toVariant().toLongLong();
    book.title = obj["title"].toString();
    book.author = obj["author"].toString();

    if (!obj["chapters"].isArray()) {
        if (error) *error = "missing chapters array";
        return false;
    }

    const QJsonArray chapters = obj["chapters"].toArray();
    int position = 0;
    for (const auto& value : chapters) {
        ++position;
        const QJsonObject ch = value.toObject();

        ChapterData chapter;
        chapter.chapterNumber = ch["chapterNumber"].toInt(position);
        chapter.title = ch["title"].toString();
        if (!ch["content"].isString()) {
            if (error) *error = QString("chapter %1 has no content").arg(chapter.chapterNumber);
            return false;
        }
        chapter.content = ch["content"].toString();
        chapter.audioUrl = ch["audioUrl"].toString();
        chapter.audioDuration = ch["audioDuration"].toDouble(0.0);
        if (chapter.audioDuration < 0.0) {
            if (error) *error = QString("chapter %1 has a negative audio duration")
                                    .arg(chapter.chapterNumber);
            return false;
        }

        for (const auto& tsValue : ch["audioTimestamps"].toArray()) {
            const QJsonObject ts = tsValue.toObject();
            AudioTimestamp stamp;
            stamp.word = ts["word"].toString();
            stamp.start = ts["start"].toDouble();
            stamp.end = ts["end"].toDouble();
            chapter.audioTimestamps.push_back(stamp);
        }

        QString tsError;
        if (!validateTimestamps(chapter.audioTimestamps, &tsError)) {
            if (error) *error = QString("chapter %1: %2").arg(chapter.chapterNumber).arg(tsError);
            return false;
        }

        book.chapters.push_back(std::move(chapter));
    }
    return true;
}

bool JsonBookSource::validateTimestamps(const std::vector<AudioTimestamp>& timestamps,
                                        QString* error) {
    for (size_t i = 0; i < timestamps.size(); ++i) {
        const AudioTimestamp& t = timestamps[i];
        if (t.end + TimestampTolerance < t.start) {
            if (error) *error = QString("timestamp %1 ends before it starts").arg(i);
            return false;
        }
        if (i == 0) continue;

        const AudioTimestamp& prev = timestamps[i - 1];
        if (t.start + TimestampTolerance < prev.start) {
            if (error) *error = QString("timestamp %1 is out of order").arg(i);
            return false;
        }
        if (t.start + TimestampTolerance < prev.end) {
            if (error) *error = QString("timestamp %1 overlaps the previous word").arg(i);
            return false;
        }
    }
    return true;
}
