#pragma once

#include <QByteArray>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QtGlobal>

struct CachedResponse {
    int status = 200;
    QByteArray contentType = "application/json";
    QByteArray body;
};

// Per-job cache for the book API response the render page fetches on every
// navigation. Only GET /api/books/{bookId} is eligible; entries are keyed by
// URL path so query strings share one entry.
class ResponseCache {
public:
    explicit ResponseCache(qint64 bookId);

    bool accepts(const QString& method, const QUrl& url) const;

    // Cached response for url, or nullptr. Counts a hit or a miss.
    const CachedResponse* find(const QUrl& url);
    bool contains(const QUrl& url) const;

    // Keeps the first 200 response per path; later ones are ignored.
    bool store(const QUrl& url, const CachedResponse& response);

    // Interception patterns for the browser (wildcards * and ?).
    QStringList urlPatterns() const;

    qint64 bookId() const { return m_bookId; }
    int hits() const { return m_hits; }
    int misses() const { return m_misses; }
    int size() const { return m_entries.size(); }
    void clear();

private:
    QString apiPath() const;

    qint64 m_bookId;
    QHash<QString, CachedResponse> m_entries;
    int m_hits = 0;
    int m_misses = 0;
};
