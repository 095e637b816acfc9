#pragma once

#include <QObject>
#include <QString>
#include "ObjectStore.h"

// Object store reached over plain HTTP: PUT {baseUrl}/{key} to upload and
// DELETE {url} to remove, authenticated with a bearer token when one is set.
// The object URL is taken from a JSON {"url": ...} response body, falling
// back to {baseUrl}/{key}.
class HttpObjectStore : public QObject, public ObjectStore {
    Q_OBJECT
public:
    explicit HttpObjectStore(const QString& baseUrl, const QString& token = QString(),
                             QObject* parent = nullptr);
    ~HttpObjectStore();

    bool upload(const QString& key, const QByteArray& data,
                const QByteArray& contentType, QString* url) override;
    bool remove(const QString& url) override;
    QString errorString() const override { return m_error; }

    void setTimeout(int ms) { m_timeoutMs = ms; }

private:
    QString m_baseUrl;
    QString m_token;
    QString m_error;
    int m_timeoutMs = 120000;
};
