#pragma once

#include <QObject>
#include <QString>
#include "ObjectStore.h"

// Stores objects as files below a root directory.
//
// URLs are "{publicBaseUrl}/{key}" when a public base URL is set (the root
// is then expected to be served by a web server), otherwise file:// URLs.
class LocalObjectStore : public QObject, public ObjectStore {
    Q_OBJECT
public:
    explicit LocalObjectStore(const QString& rootDir, const QString& publicBaseUrl = QString(),
                              QObject* parent = nullptr);
    ~LocalObjectStore();

    bool upload(const QString& key, const QByteArray& data,
                const QByteArray& contentType, QString* url) override;
    bool remove(const QString& url) override;
    QString errorString() const override { return m_error; }

    QString rootDir() const { return m_rootDir; }

    // Local path for a URL produced by this store, empty if it is foreign.
    QString pathForUrl(const QString& url) const;

private:
    QString urlForKey(const QString& key) const;

    QString m_rootDir;
    QString m_publicBaseUrl;
    QString m_error;
};
