#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

struct HttpResponse {
    int status = 0;
    QByteArray body;
    QByteArray contentType;
    QString error;      // transport error, empty when the request completed

    bool ok() const { return error.isEmpty() && status >= 200 && status < 300; }
};

using HttpHeaders = QList<QPair<QByteArray, QByteArray>>;

// Blocking HTTP calls on top of QNetworkAccessManager. Each call spins a
// local event loop until the reply finishes or the timeout elapses.
namespace HttpTransfer {

HttpResponse get(const QUrl& url, int timeoutMs = 60000, const HttpHeaders& headers = {});
HttpResponse put(const QUrl& url, const QByteArray& data, const QByteArray& contentType,
                 int timeoutMs = 120000, const HttpHeaders& headers = {});
HttpResponse deleteResource(const QUrl& url, int timeoutMs = 30000, const HttpHeaders& headers = {});

// Describes a failed response for error messages.
QString describe(const HttpResponse& response);

} // namespace HttpTransfer
