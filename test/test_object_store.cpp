#include <cassert>
#include <cstdio>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QHash>
#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>
#include <QUrl>
#include "storage/HttpObjectStore.h"
#include "storage/LocalObjectStore.h"

// Answers every request with a fixed status and body and records what it saw.
class StubHttpServer : public QObject {
public:
    explicit StubHttpServer(int status = 200, const QByteArray& body = QByteArray())
        : m_status(status), m_body(body)
    {
        m_server.listen(QHostAddress::LocalHost, 0);
        QObject::connect(&m_server, &QTcpServer::newConnection, this, [this]() {
            while (QTcpSocket* socket = m_server.nextPendingConnection()) {
                QObject::connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
                    handle(socket);
                });
            }
        });
    }

    QString baseUrl() const { return QString("http://127.0.0.1:%1").arg(m_server.serverPort()); }

    QByteArray lastMethod;
    QByteArray lastPath;
    QByteArray lastAuthorization;
    QByteArray lastContentType;
    QByteArray lastBody;
    int requests = 0;

private:
    void handle(QTcpSocket* socket) {
        QByteArray& buffer = m_buffers[socket];
        buffer += socket->readAll();

        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) return;

        const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
        int contentLength = 0;
        QByteArray authorization;
        QByteArray contentType;
        for (int i = 1; i < lines.size(); ++i) {
            const QByteArray line = lines[i].trimmed();
            const int colon = line.indexOf(':');
            if (colon < 0) continue;
            const QByteArray name = line.left(colon).trimmed().toLower();
            const QByteArray value = line.mid(colon + 1).trimmed();
            if (name == "content-length") contentLength = value.toInt();
            if (name == "authorization") authorization = value;
            if (name == "content-type") contentType = value;
        }
        if (buffer.size() < headerEnd + 4 + contentLength) return;

        const QList<QByteArray> requestLine = lines[0].trimmed().split(' ');
        lastMethod = requestLine.value(0);
        lastPath = requestLine.value(1);
        lastAuthorization = authorization;
        lastContentType = contentType;
        lastBody = buffer.mid(headerEnd + 4, contentLength);
        ++requests;
        m_buffers.remove(socket);

        QByteArray response = "HTTP/1.1 " + QByteArray::number(m_status) + " Stub\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: " + QByteArray::number(m_body.size()) + "\r\n"
            "Connection: close\r\n\r\n" + m_body;
        socket->write(response);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    QHash<QTcpSocket*, QByteArray> m_buffers;
    int m_status;
    QByteArray m_body;
};

void test_local_upload_and_remove() {
    QTemporaryDir dir;
    LocalObjectStore store(dir.path());

    QString url;
    assert(store.upload("video-exports/7/full-book-1.mp4", "mp4data", "video/mp4", &url));
    assert(url.startsWith("file://"));

    const QString path = QDir(dir.path()).filePath("video-exports/7/full-book-1.mp4");
    QFile file(path);
    bool opened = file.open(QIODevice::ReadOnly);
    assert(opened);
    assert(file.readAll() == "mp4data");
    file.close();

    assert(store.pathForUrl(url) == QDir(store.rootDir()).filePath("video-exports/7/full-book-1.mp4"));
    assert(store.remove(url));
    assert(!QFile::exists(path));

    // Second delete reports the missing object
    assert(!store.remove(url));
    assert(store.errorString().contains("does not exist"));
    printf("PASS: test_local_upload_and_remove\n");
}

void test_local_public_urls() {
    QTemporaryDir dir;
    LocalObjectStore store(dir.path(), "https://media.example.com/books/");

    QString url;
    assert(store.upload("frames/frame-000001.jpg", "jpeg", "image/jpeg", &url));
    assert(url == "https://media.example.com/books/frames/frame-000001.jpg");
    assert(QFile::exists(QDir(dir.path()).filePath("frames/frame-000001.jpg")));
    assert(store.remove(url));

    assert(!store.remove("https://elsewhere.example.com/frames/frame-000001.jpg"));
    assert(store.errorString().contains("Not an object"));
    printf("PASS: test_local_public_urls\n");
}

void test_local_rejects_escaping_keys() {
    QTemporaryDir dir;
    LocalObjectStore store(QDir(dir.path()).filePath("root"));

    QString url;
    assert(!store.upload("../outside.mp4", "x", "video/mp4", &url));
    assert(store.errorString().contains("Invalid object key"));
    assert(!store.upload("/etc/passwd", "x", "text/plain", &url));
    assert(!store.upload("", "x", "text/plain", &url));

    assert(store.pathForUrl(QUrl::fromLocalFile(QDir(dir.path()).filePath("other.mp4")).toString()).isEmpty());
    printf("PASS: test_local_rejects_escaping_keys\n");
}

void test_http_upload() {
    StubHttpServer server(200, "{\"url\":\"https://cdn.example.com/v/1.mp4\"}");
    HttpObjectStore store(server.baseUrl() + "/bucket/", "token-123");
    store.setTimeout(5000);

    QString url;
    assert(store.upload("video-exports/1/full-book-5.mp4", "payload", "video/mp4", &url));
    assert(url == "https://cdn.example.com/v/1.mp4");
    assert(server.lastMethod == "PUT");
    assert(server.lastPath == "/bucket/video-exports/1/full-book-5.mp4");
    assert(server.lastAuthorization == "Bearer token-123");
    assert(server.lastContentType == "video/mp4");
    assert(server.lastBody == "payload");
    printf("PASS: test_http_upload\n");
}

void test_http_upload_without_url_in_reply() {
    StubHttpServer server(201);
    HttpObjectStore store(server.baseUrl());
    store.setTimeout(5000);

    QString url;
    assert(store.upload("a/b.jpg", "jpeg", "image/jpeg", &url));
    assert(url == server.baseUrl() + "/a/b.jpg");
    assert(server.lastAuthorization.isEmpty());

    assert(store.remove(url));
    assert(server.lastMethod == "DELETE");
    assert(server.lastPath == "/a/b.jpg");
    printf("PASS: test_http_upload_without_url_in_reply\n");
}

void test_http_errors() {
    StubHttpServer server(500, "{\"error\":\"disk full\"}");
    HttpObjectStore store(server.baseUrl());
    store.setTimeout(5000);

    QString url;
    assert(!store.upload("x.mp4", "data", "video/mp4", &url));
    assert(store.errorString().contains("HTTP 500"));
    assert(store.errorString().contains("disk full"));

    assert(!store.remove(server.baseUrl() + "/x.mp4"));
    assert(store.errorString().contains("HTTP 500"));
    printf("PASS: test_http_errors\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_local_upload_and_remove();
    test_local_public_urls();
    test_local_rejects_escaping_keys();
    test_http_upload();
    test_http_upload_without_url_in_reply();
    test_http_errors();
    printf("All object store tests passed.\n");
    return 0;
}
