#include "HttpObjectStore.h"
#include "HttpTransfer.h"
#include "Log.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>

namespace {

HttpHeaders authHeaders(const QString& token) {
    HttpHeaders headers;
    if (!token.isEmpty()) {
        headers.append({"Authorization", "Bearer " + token.toUtf8()});
    }
    return headers;
}

} // namespace

HttpObjectStore::HttpObjectStore(const QString& baseUrl, const QString& token, QObject* parent)
    : QObject(parent), m_baseUrl(baseUrl), m_token(token)
{
    while (m_baseUrl.endsWith('/')) m_baseUrl.chop(1);
}

HttpObjectStore::~HttpObjectStore() = default;

bool HttpObjectStore::upload(const QString& key, const QByteArray& data,
                             const QByteArray& contentType, QString* url) {
    const QString target = m_baseUrl + '/' + key;
    HttpResponse response = HttpTransfer::put(QUrl(target), data, contentType, m_timeoutMs,
                                              authHeaders(m_token));
    if (!response.ok()) {
        m_error = QString("Upload of %1 failed: %2").arg(key, HttpTransfer::describe(response));
        qCWarning(lcStorage) << m_error;
        return false;
    }

    QString objectUrl = target;
    QJsonDocument doc = QJsonDocument::fromJson(response.body);
    if (doc.isObject()) {
        const QString returned = doc.object()["url"].toString();
        if (!returned.isEmpty()) objectUrl = returned;
    }

    qCDebug(lcStorage) << "Uploaded" << data.size() << "bytes to" << objectUrl;
    if (url) *url = objectUrl;
    return true;
}

bool HttpObjectStore::remove(const QString& url) {
    HttpResponse response = HttpTransfer::deleteResource(QUrl(url), m_timeoutMs,
                                                         authHeaders(m_token));
    if (!response.ok()) {
        m_error = QString("Delete of %1 failed: %2").arg(url, HttpTransfer::describe(response));
        return false;
    }
    return true;
}
