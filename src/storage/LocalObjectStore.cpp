#include "LocalObjectStore.h"
#include "Log.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QUrl>

LocalObjectStore::LocalObjectStore(const QString& rootDir, const QString& publicBaseUrl,
                                   QObject* parent)
    : QObject(parent)
    , m_rootDir(QDir(rootDir).absolutePath())
    , m_publicBaseUrl(publicBaseUrl)
{
    while (m_publicBaseUrl.endsWith('/')) m_publicBaseUrl.chop(1);
}

LocalObjectStore::~LocalObjectStore() = default;

bool LocalObjectStore::upload(const QString& key, const QByteArray& data,
                              const QByteArray& contentType, QString* url) {
    Q_UNUSED(contentType);

    const QString cleanKey = QDir::cleanPath(key);
    if (cleanKey.isEmpty() || cleanKey.startsWith("..") || QDir::isAbsolutePath(cleanKey)) {
        m_error = QString("Invalid object key: %1").arg(key);
        return false;
    }

    const QString filePath = QDir(m_rootDir).filePath(cleanKey);
    if (!QDir().mkpath(QFileInfo(filePath).absolutePath())) {
        m_error = QString("Cannot create directory for: %1").arg(filePath);
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }
    if (file.write(data) != data.size() || !file.commit()) {
        m_error = QString("Write failed: %1 (%2)").arg(filePath, file.errorString());
        return false;
    }

    qCDebug(lcStorage) << "Stored" << data.size() << "bytes at" << filePath;
    if (url) *url = urlForKey(cleanKey);
    return true;
}

bool LocalObjectStore::remove(const QString& url) {
    const QString filePath = pathForUrl(url);
    if (filePath.isEmpty()) {
        m_error = QString("Not an object of this store: %1").arg(url);
        return false;
    }
    if (!QFile::exists(filePath)) {
        m_error = QString("Object does not exist: %1").arg(url);
        return false;
    }
    if (!QFile::remove(filePath)) {
        m_error = QString("Cannot delete: %1").arg(filePath);
        return false;
    }
    qCDebug(lcStorage) << "Deleted" << filePath;
    return true;
}

QString LocalObjectStore::pathForUrl(const QString& url) const {
    QString relative;
    if (!m_publicBaseUrl.isEmpty() && url.startsWith(m_publicBaseUrl + '/')) {
        relative = url.mid(m_publicBaseUrl.length() + 1);
    } else {
        QUrl parsed(url);
        if (!parsed.isLocalFile()) return QString();
        relative = QDir(m_rootDir).relativeFilePath(parsed.toLocalFile());
    }

    relative = QDir::cleanPath(relative);
    if (relative.isEmpty() || relative.startsWith("..") || QDir::isAbsolutePath(relative)) {
        return QString();
    }
    return QDir(m_rootDir).filePath(relative);
}

QString LocalObjectStore::urlForKey(const QString& key) const {
    if (!m_publicBaseUrl.isEmpty()) {
        return m_publicBaseUrl + '/' + key;
    }
    return QUrl::fromLocalFile(QDir(m_rootDir).filePath(key)).toString();
}
