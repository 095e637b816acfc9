#pragma once

#include <QObject>
#include <QHash>
#include <QJsonObject>
#include <QProcess>
#include <QStringList>
#include <QTemporaryDir>
#include <QWebSocket>
#include <functional>
#include <memory>
#include "BrowserSession.h"

struct CachedResponse;

// BrowserSession over the Chrome DevTools Protocol.
//
// Either launches a local Chromium (launch()) or attaches to a running one
// (connectToBrowser()). Commands are JSON messages over one WebSocket; page
// commands are routed through a flattened target session.
class CdpSession : public QObject, public BrowserSession {
    Q_OBJECT
public:
    explicit CdpSession(QObject* parent = nullptr);
    ~CdpSession();

    // Starts program with arguments plus a private profile and a DevTools
    // port, then connects to the endpoint it reports on stderr.
    bool launch(const QString& program, const QStringList& arguments, int timeoutMs);

    // endpoint is a ws:// browser URL or an http(s):// DevTools address.
    bool connectToBrowser(const QString& endpoint, int timeoutMs);

    bool isConnected() const { return m_connected; }

    bool createPage(int width, int height) override;
    void setCommandTimeout(int ms) override { m_commandTimeoutMs = ms; }
    bool bypassServiceWorker() override;
    bool setCacheEnabled(bool enabled) override;
    bool addStyleToNewDocuments(const QString& css) override;
    bool enableResponseCache(ResponseCache* cache) override;
    bool navigate(const QUrl& url, int timeoutMs) override;
    bool evaluateBool(const QString& expression, bool* value) override;
    CaptureStatus captureElement(const QString& selector, int quality, QByteArray* jpeg) override;
    void close() override;
    QString errorString() const override { return m_error; }

signals:
    void messageProcessed();

private slots:
    void onTextMessage(const QString& message);
    void onDisconnected();

private:
    using ResultHandler = std::function<void(const QJsonObject& result, const QJsonObject& error)>;

    bool connectWebSocket(const QUrl& url, int timeoutMs);
    int sendAsync(const QString& method, const QJsonObject& params, bool toPage,
                  ResultHandler handler = nullptr);
    bool send(const QString& method, const QJsonObject& params = QJsonObject(),
              QJsonObject* result = nullptr, bool toPage = true);
    bool evaluate(const QString& expression, QJsonObject* remoteObject);
    bool waitFor(const std::function<bool()>& done, int timeoutMs);

    void handleEvent(const QString& method, const QJsonObject& params, const QString& sessionId);
    void handleRequestPaused(const QJsonObject& params);
    void continueRequest(const QString& requestId);
    void fulfillRequest(const QString& requestId, const CachedResponse& response);
    void failPending(const QString& reason);

    QWebSocket m_socket;
    std::unique_ptr<QProcess> m_process;
    std::unique_ptr<QTemporaryDir> m_profileDir;
    bool m_connected = false;
    bool m_ownsBrowser = false;

    QString m_targetId;
    QString m_sessionId;
    bool m_pageDetached = false;
    bool m_domContentLoaded = false;

    int m_nextId = 1;
    int m_commandTimeoutMs = 60000;
    QHash<int, ResultHandler> m_pending;

    ResponseCache* m_cache = nullptr;
    QString m_error;
};
