#pragma once

#include <QByteArray>
#include <QString>
#include <QUrl>

class ResponseCache;

enum class CaptureStatus {
    Ok,
    ElementMissing,
    Failed
};

// One headless browser page. The capture service drives a single session for
// a whole export job; every call blocks until the browser answers or the
// command timeout elapses.
class BrowserSession {
public:
    virtual ~BrowserSession() = default;

    // Opens the page used for every frame, with a fixed viewport at device
    // scale factor 1.
    virtual bool createPage(int width, int height) = 0;
    virtual void setCommandTimeout(int ms) = 0;

    // Best-effort tuning. Failures are reported but never fatal.
    virtual bool bypassServiceWorker() = 0;
    virtual bool setCacheEnabled(bool enabled) = 0;
    virtual bool addStyleToNewDocuments(const QString& css) = 0;

    // Answers matching requests from the cache once it holds a response.
    // The cache is not owned and must outlive the session.
    virtual bool enableResponseCache(ResponseCache* cache) = 0;

    // Loads url and waits for DOMContentLoaded.
    virtual bool navigate(const QUrl& url, int timeoutMs) = 0;
    virtual bool evaluateBool(const QString& expression, bool* value) = 0;

    // JPEG screenshot clipped to the first element matching selector.
    virtual CaptureStatus captureElement(const QString& selector, int quality,
                                         QByteArray* jpeg) = 0;

    virtual void close() = 0;
    virtual QString errorString() const = 0;
};
