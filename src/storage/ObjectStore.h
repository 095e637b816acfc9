#pragma once

#include <QByteArray>
#include <QString>

// Durable storage for exported videos and (optionally) intermediate frames.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Stores data under key and returns its public URL in *url.
    virtual bool upload(const QString& key, const QByteArray& data,
                        const QByteArray& contentType, QString* url) = 0;

    // Deletes an object previously returned by upload().
    virtual bool remove(const QString& url) = 0;

    virtual QString errorString() const = 0;
};
