#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QProcessEnvironment>
#include <QTextStream>
#include <cstdio>
#include <memory>
#include "AppConstants.h"
#include "ExportConfig.h"
#include "HttpObjectStore.h"
#include "JsonBookSource.h"
#include "LocalObjectStore.h"
#include "Log.h"
#include "ManifestJson.h"
#include "SyncCalculator.h"
#include "TextPaginator.h"
#include "VideoExporter.h"

namespace {

enum ExitCode {
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitUsage = 2
};

int usageError(const QCommandLineParser& parser, const QString& message) {
    fprintf(stderr, "%s\n\n%s", qPrintable(message), qPrintable(parser.helpText()));
    return ExitUsage;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    QCommandLineParser parser;
    parser.setApplicationDescription("Renders an audio-synchronized page-turning video of a book.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption bookOpt("book", "Book JSON file, or a directory of <id>.json files.", "path");
    QCommandLineOption bookIdOpt("book-id", "Book to export (default: the only book in --book).", "id");
    QCommandLineOption baseUrlOpt("base-url", "Origin serving the render page.", "url");
    QCommandLineOption scopeOpt("scope", "Export scope: full or chapter.", "scope", "full");
    QCommandLineOption chapterOpt("chapter", "Chapter number for a chapter export.", "n");
    QCommandLineOption themeOpt("theme", "Reading theme: day, night, sepia or focus.", "theme", "day");
    QCommandLineOption fontSizeOpt("font-size", "Font size: xs, sm, base, lg, xl or xxl.", "size", "base");
    QCommandLineOption configOpt("config", "Export configuration JSON file.", "file");
    QCommandLineOption storeOpt("store", "Directory that receives the exported video.", "dir");
    QCommandLineOption storeUrlOpt("store-url", "HTTP object store base URL (PUT/DELETE).", "url");
    QCommandLineOption manifestOpt("manifest-only", "Print the timing manifest as JSON and exit.");
    QCommandLineOption estimateOpt("estimate", "Print the size and time estimate as JSON and exit.");
    QCommandLineOption verboseOpt("verbose", "Enable debug logging.");
    parser.addOptions({bookOpt, bookIdOpt, baseUrlOpt, scopeOpt, chapterOpt, themeOpt, fontSizeOpt,
                       configOpt, storeOpt, storeUrlOpt, manifestOpt, estimateOpt, verboseOpt});
    parser.process(app);

    if (parser.isSet(verboseOpt)) {
        Log::setVerbose(true);
    }

    if (!parser.isSet(bookOpt)) {
        return usageError(parser, "--book is required");
    }

    ExportConfig config;
    if (parser.isSet(configOpt)) {
        ExportConfigFile file;
        if (!file.load(parser.value(configOpt), config)) {
            fprintf(stderr, "%s\n", qPrintable(file.errorString()));
            return ExitFailure;
        }
    }
    config.applyEnvironment(QProcessEnvironment::systemEnvironment());
    if (parser.isSet(baseUrlOpt)) config.baseUrl = parser.value(baseUrlOpt);
    if (parser.isSet(storeOpt)) config.storeDirectory = parser.value(storeOpt);
    if (parser.isSet(storeUrlOpt)) config.storeUrl = parser.value(storeUrlOpt);

    ExportRequest request;
    if (!exportScopeFromName(parser.value(scopeOpt), request.scope)) {
        return usageError(parser, QString("Unknown scope: %1").arg(parser.value(scopeOpt)));
    }
    if (request.scope == ExportScope::Chapter) {
        bool ok = false;
        request.chapterNumber = parser.value(chapterOpt).toInt(&ok);
        if (!ok || request.chapterNumber <= 0) {
            return usageError(parser, "--chapter <n> is required for a chapter export");
        }
    }
    if (!themeFromName(parser.value(themeOpt), request.theme)) {
        return usageError(parser, QString("Unknown theme: %1").arg(parser.value(themeOpt)));
    }
    if (!fontSizeFromName(parser.value(fontSizeOpt), request.fontSize)) {
        return usageError(parser, QString("Unknown font size: %1").arg(parser.value(fontSizeOpt)));
    }

    JsonBookSource books(parser.value(bookOpt));
    if (parser.isSet(bookIdOpt)) {
        bool ok = false;
        request.bookId = parser.value(bookIdOpt).toLongLong(&ok);
        if (!ok) {
            return usageError(parser, QString("Invalid book id: %1").arg(parser.value(bookIdOpt)));
        }
    } else {
        const QList<qint64> ids = books.availableBookIds();
        if (ids.size() != 1) {
            return usageError(parser, QString("--book-id is required (%1 books found)").arg(ids.size()));
        }
        request.bookId = ids.first();
    }

    std::unique_ptr<ObjectStore> store;
    if (!config.storeUrl.isEmpty()) {
        store = std::make_unique<HttpObjectStore>(config.storeUrl, config.storeToken);
    } else {
        const QString dir = config.storeDirectory.isEmpty() ? QString("exports") : config.storeDirectory;
        store = std::make_unique<LocalObjectStore>(dir);
    }

    TextPaginator paginator;
    VideoExporter exporter(&books, store.get(), &paginator, config);
    QTextStream out(stdout);

    if (parser.isSet(manifestOpt) || parser.isSet(estimateOpt)) {
        VideoManifest manifest;
        if (!exporter.generateManifest(request, manifest)) {
            fprintf(stderr, "%s\n", qPrintable(exporter.errorString()));
            return ExitFailure;
        }
        const QJsonObject json = parser.isSet(estimateOpt)
            ? ManifestJson::estimateToJson(SyncCalculator::estimateExport(manifest))
            : ManifestJson::manifestToJson(manifest);
        out << QJsonDocument(json).toJson(QJsonDocument::Indented);
        return ExitSuccess;
    }

    if (config.baseUrl.isEmpty()) {
        return usageError(parser, "--base-url is required to render frames");
    }

    QObject::connect(&exporter, &VideoExporter::progress, [&out](const ExportProgress& p) {
        if (p.phase == ExportPhase::Error) return;
        out << QString("[%1] %2% %3")
                   .arg(exportPhaseName(p.phase), -16)
                   .arg(p.progress, 5, 'f', 1)
                   .arg(p.message)
            << Qt::endl;
    });

    const ExportResult result = exporter.exportVideo(request);
    if (!result.success) {
        fprintf(stderr, "Export failed (%s): %s\n", qPrintable(exportErrorName(result.errorKind)),
                qPrintable(result.error));
        return ExitFailure;
    }

    out << "Video: " << result.videoUrl << Qt::endl;
    out << QString("Duration: %1 s, size: %2 bytes")
               .arg(result.videoDuration, 0, 'f', 1)
               .arg(result.videoSize)
        << Qt::endl;
    return ExitSuccess;
}
