#include "ResponseCache.h"
#include "AppConstants.h"

ResponseCache::ResponseCache(qint64 bookId) : m_bookId(bookId) {}

QString ResponseCache::apiPath() const {
    return QString("%1%2").arg(AppConstants::BookApiPath).arg(m_bookId);
}

bool ResponseCache::accepts(const QString& method, const QUrl& url) const {
    return method.compare("GET", Qt::CaseInsensitive) == 0 && url.path() == apiPath();
}

const CachedResponse* ResponseCache::find(const QUrl& url) {
    auto it = m_entries.constFind(url.path());
    if (it == m_entries.constEnd()) {
        ++m_misses;
        return nullptr;
    }
    ++m_hits;
    return &it.value();
}

bool ResponseCache::contains(const QUrl& url) const {
    return m_entries.contains(url.path());
}

bool ResponseCache::store(const QUrl& url, const CachedResponse& response) {
    if (response.status != 200 || url.path() != apiPath()) return false;
    if (m_entries.contains(url.path())) return false;
    m_entries.insert(url.path(), response);
    return true;
}

QStringList ResponseCache::urlPatterns() const {
    return { "*" + apiPath(), "*" + apiPath() + "?*" };
}

void ResponseCache::clear() {
    m_entries.clear();
    m_hits = 0;
    m_misses = 0;
}
