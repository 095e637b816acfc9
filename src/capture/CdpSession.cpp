#include "CdpSession.h"
#include "HttpTransfer.h"
#include "Log.h"
#include "ResponseCache.h"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QTimer>
#include <algorithm>

namespace {

constexpr int PollSliceMs = 50;
constexpr int CloseTimeoutMs = 3000;

QString protocolError(const QString& method, const QJsonObject& error) {
    return QString("%1 failed: %2 (%3)")
        .arg(method, error["message"].toString())
        .arg(error["code"].toInt());
}

// JavaScript string literal for arbitrary text.
QString jsString(const QString& text) {
    const QByteArray array = QJsonDocument(QJsonArray{text}).toJson(QJsonDocument::Compact);
    return QString::fromUtf8(array.mid(1, array.size() - 2));
}

} // namespace

CdpSession::CdpSession(QObject* parent) : QObject(parent) {
    connect(&m_socket, &QWebSocket::textMessageReceived, this, &CdpSession::onTextMessage);
    connect(&m_socket, &QWebSocket::disconnected, this, &CdpSession::onDisconnected);
}

CdpSession::~CdpSession() {
    close();
}

bool CdpSession::launch(const QString& program, const QStringList& arguments, int timeoutMs) {
    m_profileDir = std::make_unique<QTemporaryDir>();
    if (!m_profileDir->isValid()) {
        m_error = "Cannot create browser profile directory";
        return false;
    }

    QStringList args = arguments;
    args << "--remote-debugging-port=0"
         << QString("--user-data-dir=%1").arg(m_profileDir->path())
         << "about:blank";

    m_process = std::make_unique<QProcess>();
    m_process->setProgram(program);
    m_process->setArguments(args);
    qCDebug(lcCapture) << "Launching" << program << args.join(' ');
    m_process->start();
    if (!m_process->waitForStarted(timeoutMs)) {
        m_error = QString("Cannot start %1: %2").arg(program, m_process->errorString());
        m_process.reset();
        return false;
    }
    m_ownsBrowser = true;

    static const QRegularExpression listening("DevTools listening on (ws://\\S+)");
    QByteArray stderrData;
    QString endpoint;
    const bool settled = waitFor([&] {
        stderrData += m_process->readAllStandardError();
        QRegularExpressionMatch match = listening.match(QString::fromUtf8(stderrData));
        if (match.hasMatch()) {
            endpoint = match.captured(1);
            return true;
        }
        return m_process->state() == QProcess::NotRunning;
    }, timeoutMs);

    if (!settled || endpoint.isEmpty()) {
        stderrData += m_process->readAllStandardError();
        const QString tail = QString::fromUtf8(stderrData.right(500)).trimmed();
        m_error = m_process->state() == QProcess::NotRunning
            ? QString("%1 exited before opening DevTools: %2").arg(program, tail)
            : QString("%1 did not report a DevTools endpoint within %2 ms").arg(program).arg(timeoutMs);
        close();
        return false;
    }

    if (!connectWebSocket(QUrl(endpoint), timeoutMs)) {
        close();
        return false;
    }
    return true;
}

bool CdpSession::connectToBrowser(const QString& endpoint, int timeoutMs) {
    QUrl url(endpoint);
    if (url.scheme() == "http" || url.scheme() == "https") {
        QUrl versionUrl = url;
        QString path = versionUrl.path();
        while (path.endsWith('/')) path.chop(1);
        versionUrl.setPath(path + "/json/version");

        HttpResponse response = HttpTransfer::get(versionUrl, timeoutMs);
        if (!response.ok()) {
            m_error = QString("DevTools endpoint %1: %2").arg(endpoint, HttpTransfer::describe(response));
            return false;
        }
        const QString wsUrl = QJsonDocument::fromJson(response.body).object()["webSocketDebuggerUrl"].toString();
        if (wsUrl.isEmpty()) {
            m_error = QString("DevTools endpoint %1 did not return webSocketDebuggerUrl").arg(endpoint);
            return false;
        }
        url = QUrl(wsUrl);
    }

    if (url.scheme() != "ws" && url.scheme() != "wss") {
        m_error = QString("Unsupported browser endpoint: %1").arg(endpoint);
        return false;
    }
    m_ownsBrowser = false;
    return connectWebSocket(url, timeoutMs);
}

bool CdpSession::connectWebSocket(const QUrl& url, int timeoutMs) {
    bool opened = false;
    auto conn = connect(&m_socket, &QWebSocket::connected, this, [&] {
        opened = true;
        emit messageProcessed();
    });
    m_socket.open(url);
    const bool settled = waitFor([&] {
        return opened || m_socket.state() == QAbstractSocket::UnconnectedState;
    }, timeoutMs);
    disconnect(conn);

    if (!settled || !opened) {
        m_error = QString("Cannot connect to %1: %2").arg(url.toString(), m_socket.errorString());
        m_socket.abort();
        return false;
    }
    m_connected = true;
    qCDebug(lcCapture) << "Connected to DevTools at" << url.toString();
    return true;
}

bool CdpSession::createPage(int width, int height) {
    QJsonObject result;
    if (!send("Target.createTarget", {{"url", "about:blank"}}, &result, false)) return false;
    m_targetId = result["targetId"].toString();

    if (!send("Target.attachToTarget", {{"targetId", m_targetId}, {"flatten", true}}, &result, false)) {
        return false;
    }
    m_sessionId = result["sessionId"].toString();
    m_pageDetached = false;

    QJsonObject metrics{
        {"width", width},
        {"height", height},
        {"deviceScaleFactor", 1},
        {"mobile", false},
    };
    if (!send("Emulation.setDeviceMetricsOverride", metrics)) return false;
    return send("Page.enable");
}

bool CdpSession::bypassServiceWorker() {
    return send("Network.enable") && send("Network.setBypassServiceWorker", {{"bypass", true}});
}

bool CdpSession::setCacheEnabled(bool enabled) {
    return send("Network.setCacheDisabled", {{"cacheDisabled", !enabled}});
}

bool CdpSession::addStyleToNewDocuments(const QString& css) {
    const QString source = QString(
        "(() => {"
        " const install = () => {"
        "  const style = document.createElement('style');"
        "  style.textContent = %1;"
        "  (document.head || document.documentElement).appendChild(style);"
        " };"
        " if (document.readyState === 'loading') document.addEventListener('DOMContentLoaded', install);"
        " else install();"
        "})();").arg(jsString(css));
    return send("Page.addScriptToEvaluateOnNewDocument", {{"source", source}});
}

bool CdpSession::enableResponseCache(ResponseCache* cache) {
    QJsonArray patterns;
    for (const QString& pattern : cache->urlPatterns()) {
        patterns.append(QJsonObject{{"urlPattern", pattern}, {"requestStage", "Request"}});
        patterns.append(QJsonObject{{"urlPattern", pattern}, {"requestStage", "Response"}});
    }
    if (!send("Fetch.enable", {{"patterns", patterns}})) return false;
    m_cache = cache;
    return true;
}

bool CdpSession::navigate(const QUrl& url, int timeoutMs) {
    m_domContentLoaded = false;

    QJsonObject result;
    if (!send("Page.navigate", {{"url", url.toString(QUrl::FullyEncoded)}}, &result)) return false;

    const QString errorText = result["errorText"].toString();
    if (!errorText.isEmpty()) {
        m_error = QString("Navigation to %1 failed: %2").arg(url.toString(), errorText);
        return false;
    }
    // Same-document navigations carry no loader and fire no load events
    if (!result.contains("loaderId")) return true;

    if (!waitFor([this] { return m_domContentLoaded || !m_connected || m_pageDetached; }, timeoutMs)) {
        m_error = QString("Navigation timeout of %1 ms exceeded: %2").arg(timeoutMs).arg(url.toString());
        return false;
    }
    if (!m_domContentLoaded) {
        m_error = "Browser connection lost during navigation";
        return false;
    }
    return true;
}

bool CdpSession::evaluate(const QString& expression, QJsonObject* remoteObject) {
    QJsonObject result;
    if (!send("Runtime.evaluate", {{"expression", expression}, {"returnByValue", true}}, &result)) {
        return false;
    }
    if (result.contains("exceptionDetails")) {
        const QJsonObject details = result["exceptionDetails"].toObject();
        m_error = QString("Script error: %1")
            .arg(details["exception"].toObject()["description"].toString(details["text"].toString()));
        return false;
    }
    *remoteObject = result["result"].toObject();
    return true;
}

bool CdpSession::evaluateBool(const QString& expression, bool* value) {
    QJsonObject remote;
    if (!evaluate(expression, &remote)) return false;
    *value = remote["value"].toBool(false);
    return true;
}

CaptureStatus CdpSession::captureElement(const QString& selector, int quality, QByteArray* jpeg) {
    const QString expression = QString(
        "(() => {"
        " const el = document.querySelector(%1);"
        " if (!el) return null;"
        " const r = el.getBoundingClientRect();"
        " return { x: r.left + window.scrollX, y: r.top + window.scrollY,"
        "          width: r.width, height: r.height };"
        "})()").arg(jsString(selector));

    QJsonObject remote;
    if (!evaluate(expression, &remote)) return CaptureStatus::Failed;
    if (!remote["value"].isObject()) {
        m_error = QString("Element not found: %1").arg(selector);
        return CaptureStatus::ElementMissing;
    }

    const QJsonObject rect = remote["value"].toObject();
    if (rect["width"].toDouble() <= 0.0 || rect["height"].toDouble() <= 0.0) {
        m_error = QString("Element %1 has no visible area").arg(selector);
        return CaptureStatus::Failed;
    }

    QJsonObject clip{
        {"x", rect["x"].toDouble()},
        {"y", rect["y"].toDouble()},
        {"width", rect["width"].toDouble()},
        {"height", rect["height"].toDouble()},
        {"scale", 1},
    };
    QJsonObject params{
        {"format", "jpeg"},
        {"quality", quality},
        {"clip", clip},
        {"captureBeyondViewport", true},
    };

    QJsonObject result;
    if (!send("Page.captureScreenshot", params, &result)) return CaptureStatus::Failed;

    *jpeg = QByteArray::fromBase64(result["data"].toString().toLatin1());
    if (jpeg->isEmpty()) {
        m_error = "Screenshot returned no data";
        return CaptureStatus::Failed;
    }
    return CaptureStatus::Ok;
}

void CdpSession::close() {
    if (m_connected) {
        const int previousTimeout = m_commandTimeoutMs;
        m_commandTimeoutMs = CloseTimeoutMs;
        if (!m_targetId.isEmpty() && !send("Target.closeTarget", {{"targetId", m_targetId}}, nullptr, false)) {
            qCDebug(lcCapture) << "Closing page:" << m_error;
        }
        if (m_ownsBrowser && !send("Browser.close", QJsonObject(), nullptr, false)) {
            qCDebug(lcCapture) << "Closing browser:" << m_error;
        }
        m_commandTimeoutMs = previousTimeout;
    }
    m_targetId.clear();
    m_sessionId.clear();
    m_cache = nullptr;

    if (m_socket.state() != QAbstractSocket::UnconnectedState) {
        m_socket.close();
    }
    m_connected = false;
    failPending("Session closed");

    if (m_process) {
        if (m_process->state() != QProcess::NotRunning && !m_process->waitForFinished(CloseTimeoutMs)) {
            qCWarning(lcCapture) << "Browser did not exit, killing it";
            m_process->kill();
            m_process->waitForFinished(CloseTimeoutMs);
        }
        m_process.reset();
    }
    m_profileDir.reset();
}

int CdpSession::sendAsync(const QString& method, const QJsonObject& params, bool toPage,
                          ResultHandler handler) {
    const int id = m_nextId++;
    QJsonObject message{{"id", id}, {"method", method}};
    if (!params.isEmpty()) message["params"] = params;
    if (toPage) message["sessionId"] = m_sessionId;

    if (handler) m_pending.insert(id, std::move(handler));
    m_socket.sendTextMessage(QString::fromUtf8(QJsonDocument(message).toJson(QJsonDocument::Compact)));
    return id;
}

bool CdpSession::send(const QString& method, const QJsonObject& params, QJsonObject* result,
                      bool toPage) {
    if (!m_connected) {
        m_error = QString("%1 failed: not connected").arg(method);
        return false;
    }
    if (toPage && (m_sessionId.isEmpty() || m_pageDetached)) {
        m_error = QString("%1 failed: no page").arg(method);
        return false;
    }

    bool done = false;
    QJsonObject reply;
    QJsonObject error;
    const int id = sendAsync(method, params, toPage,
        [&](const QJsonObject& r, const QJsonObject& e) {
            done = true;
            reply = r;
            error = e;
        });

    if (!waitFor([&] { return done; }, m_commandTimeoutMs)) {
        m_pending.remove(id);
        m_error = QString("%1 timed out after %2 ms").arg(method).arg(m_commandTimeoutMs);
        return false;
    }
    if (!error.isEmpty()) {
        m_error = protocolError(method, error);
        return false;
    }
    if (result) *result = reply;
    return true;
}

bool CdpSession::waitFor(const std::function<bool()>& done, int timeoutMs) {
    QElapsedTimer elapsed;
    elapsed.start();
    while (!done()) {
        const qint64 remaining = timeoutMs - elapsed.elapsed();
        if (remaining <= 0) return false;

        QEventLoop loop;
        QTimer timer;
        timer.setSingleShot(true);
        connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
        connect(this, &CdpSession::messageProcessed, &loop, &QEventLoop::quit);
        timer.start(static_cast<int>(std::min<qint64>(remaining, PollSliceMs)));
        loop.exec();
    }
    return true;
}

void CdpSession::onTextMessage(const QString& message) {
    const QJsonObject obj = QJsonDocument::fromJson(message.toUtf8()).object();

    if (obj.contains("id")) {
        const int id = obj["id"].toInt();
        ResultHandler handler = m_pending.take(id);
        if (handler) {
            handler(obj["result"].toObject(), obj["error"].toObject());
        }
    } else if (obj.contains("method")) {
        handleEvent(obj["method"].toString(), obj["params"].toObject(), obj["sessionId"].toString());
    }
    emit messageProcessed();
}

void CdpSession::onDisconnected() {
    if (m_connected) {
        qCWarning(lcCapture) << "DevTools connection closed";
    }
    m_connected = false;
    failPending("Connection closed");
    emit messageProcessed();
}

void CdpSession::failPending(const QString& reason) {
    const auto pending = std::move(m_pending);
    m_pending.clear();
    const QJsonObject error{{"code", -1}, {"message", reason}};
    for (const ResultHandler& handler : pending) {
        handler(QJsonObject(), error);
    }
}

void CdpSession::handleEvent(const QString& method, const QJsonObject& params,
                             const QString& sessionId) {
    if (method == "Page.domContentEventFired" && sessionId == m_sessionId) {
        m_domContentLoaded = true;
    } else if (method == "Fetch.requestPaused") {
        handleRequestPaused(params);
    } else if (method == "Target.detachedFromTarget" && params["sessionId"].toString() == m_sessionId) {
        qCWarning(lcCapture) << "Page detached";
        m_pageDetached = true;
    } else if (method == "Inspector.detached") {
        qCWarning(lcCapture) << "Inspector detached:" << params["reason"].toString();
        m_pageDetached = true;
    }
}

void CdpSession::handleRequestPaused(const QJsonObject& params) {
    const QString requestId = params["requestId"].toString();
    const QJsonObject request = params["request"].toObject();
    const QUrl url(request["url"].toString());

    if (!m_cache || !m_cache->accepts(request["method"].toString(), url)) {
        continueRequest(requestId);
        return;
    }

    // Request stage
    if (!params.contains("responseStatusCode") && !params.contains("responseErrorReason")) {
        if (const CachedResponse* cached = m_cache->find(url)) {
            fulfillRequest(requestId, *cached);
        } else {
            continueRequest(requestId);
        }
        return;
    }

    // Response stage
    const int status = params["responseStatusCode"].toInt();
    if (status != 200 || m_cache->contains(url)) {
        continueRequest(requestId);
        return;
    }

    QByteArray contentType = "application/json";
    for (const auto& value : params["responseHeaders"].toArray()) {
        const QJsonObject header = value.toObject();
        if (header["name"].toString().compare("content-type", Qt::CaseInsensitive) == 0) {
            contentType = header["value"].toString().toUtf8();
        }
    }

    sendAsync("Fetch.getResponseBody", {{"requestId", requestId}}, true,
        [this, requestId, url, contentType](const QJsonObject& result, const QJsonObject& error) {
            if (!error.isEmpty()) {
                qCWarning(lcCapture) << "Cannot read book API response:" << error["message"].toString();
            } else if (m_cache) {
                CachedResponse response;
                response.status = 200;
                response.contentType = contentType;
                const QString body = result["body"].toString();
                response.body = result["base64Encoded"].toBool()
                    ? QByteArray::fromBase64(body.toLatin1())
                    : body.toUtf8();
                if (m_cache->store(url, response)) {
                    qCDebug(lcCapture) << "Cached" << url.path() << response.body.size() << "bytes";
                }
            }
            if (m_connected) continueRequest(requestId);
        });
}

void CdpSession::continueRequest(const QString& requestId) {
    sendAsync("Fetch.continueRequest", {{"requestId", requestId}}, true,
        [requestId](const QJsonObject&, const QJsonObject& error) {
            if (!error.isEmpty()) {
                qCDebug(lcCapture) << "continueRequest" << requestId << error["message"].toString();
            }
        });
}

void CdpSession::fulfillRequest(const QString& requestId, const CachedResponse& response) {
    QJsonArray headers{
        QJsonObject{{"name", "Content-Type"}, {"value", QString::fromUtf8(response.contentType)}},
    };
    QJsonObject params{
        {"requestId", requestId},
        {"responseCode", response.status},
        {"responseHeaders", headers},
        {"body", QString::fromLatin1(response.body.toBase64())},
    };
    sendAsync("Fetch.fulfillRequest", params, true,
        [requestId](const QJsonObject&, const QJsonObject& error) {
            if (!error.isEmpty()) {
                qCDebug(lcCapture) << "fulfillRequest" << requestId << error["message"].toString();
            }
        });
}
