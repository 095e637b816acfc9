#include "HttpTransfer.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <memory>

namespace {

QNetworkRequest makeRequest(const QUrl& url, const HttpHeaders& headers) {
    QNetworkRequest request(url);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    for (const auto& header : headers) {
        request.setRawHeader(header.first, header.second);
    }
    return request;
}

template <typename Issue>
HttpResponse run(Issue issue, int timeoutMs) {
    QNetworkAccessManager manager;
    std::unique_ptr<QNetworkReply> reply(issue(manager));

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(timeoutMs);
    if (!reply->isFinished()) {
        loop.exec();
    }

    HttpResponse response;
    if (!reply->isFinished()) {
        reply->abort();
        response.error = QString("Request timed out after %1 ms").arg(timeoutMs);
        return response;
    }

    response.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll();
    response.contentType = reply->header(QNetworkRequest::ContentTypeHeader).toByteArray();

    // HTTP error statuses are reported through the status code; only transport
    // failures (no status at all) count as errors here.
    if (reply->error() != QNetworkReply::NoError && response.status == 0) {
        response.error = reply->errorString();
    }
    return response;
}

} // namespace

namespace HttpTransfer {

HttpResponse get(const QUrl& url, int timeoutMs, const HttpHeaders& headers) {
    return run([&](QNetworkAccessManager& manager) {
        return manager.get(makeRequest(url, headers));
    }, timeoutMs);
}

HttpResponse put(const QUrl& url, const QByteArray& data, const QByteArray& contentType,
                 int timeoutMs, const HttpHeaders& headers) {
    return run([&](QNetworkAccessManager& manager) {
        QNetworkRequest request = makeRequest(url, headers);
        request.setHeader(QNetworkRequest::ContentTypeHeader, contentType);
        return manager.put(request, data);
    }, timeoutMs);
}

HttpResponse deleteResource(const QUrl& url, int timeoutMs, const HttpHeaders& headers) {
    return run([&](QNetworkAccessManager& manager) {
        return manager.deleteResource(makeRequest(url, headers));
    }, timeoutMs);
}

QString describe(const HttpResponse& response) {
    if (!response.error.isEmpty()) {
        return response.error;
    }
    QString detail = QString::fromUtf8(response.body.left(200)).trimmed();
    if (detail.isEmpty()) {
        return QString("HTTP %1").arg(response.status);
    }
    return QString("HTTP %1: %2").arg(response.status).arg(detail);
}

} // namespace HttpTransfer
