#pragma once

#include <QObject>
#include <QJsonObject>
#include <QList>
#include <QString>
#include "BookSource.h"

// Books stored as JSON documents: either a single book file or a directory
// of "<bookId>.json" files.
//
// {
//   "id": 7, "title": "...", "author": "...",
//   "chapters": [ { "chapterNumber": 1, "title": "...", "content": "...",
//                   "audioUrl": "...", "audioDuration": 40.0,
//                   "audioTimestamps": [ {"word": "...", "start": 0.0, "end": 0.4} ] } ]
// }
class JsonBookSource : public QObject, public BookSource {
    Q_OBJECT
public:
    explicit JsonBookSource(const QString& path, QObject* parent = nullptr);
    ~JsonBookSource();

    bool loadBook(qint64 bookId, BookData& book) override;
    QString errorString() const override { return m_error; }

    // Book ids that loadBook() can serve.
    QList<qint64> availableBookIds() const;

    static bool bookFromJson(const QJsonObject& obj, BookData& book, QString* error);

    // Timestamps must be ordered by start, non-overlapping, with end >= start.
    static bool validateTimestamps(const std::vector<AudioTimestamp>& timestamps, QString* error);

private:
    bool readDocument(const QString& filePath, QJsonObject& root);

    QString m_path;
    QString m_error;
};
