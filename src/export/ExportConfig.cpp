#include "ExportConfig.h"
#include "Log.h"

#include <QFile>
#include <QJsonDocument>
#include <algorithm>

void ExportConfig::applyEnvironment(const QProcessEnvironment& env) {
    if (env.contains("BOOKREEL_UPLOAD_FRAMES")) {
        const QString value = env.value("BOOKREEL_UPLOAD_FRAMES").trimmed().toLower();
        uploadFrames = value == "true" || value == "1";
    }
    if (env.contains("BOOKREEL_JPEG_QUALITY")) {
        bool ok = false;
        const int quality = env.value("BOOKREEL_JPEG_QUALITY").toInt(&ok);
        if (ok) {
            capture.jpegQuality = std::clamp(quality, AppConstants::MinJpegQuality,
                                             AppConstants::MaxJpegQuality);
        } else {
            qCWarning(lcExport) << "Ignoring invalid BOOKREEL_JPEG_QUALITY";
        }
    }
    if (!env.value("FFMPEG_PATH").isEmpty()) {
        ffmpegPath = env.value("FFMPEG_PATH");
    }
    if (!env.value("CHROME_EXECUTABLE_PATH").isEmpty()) {
        browserExecutable = env.value("CHROME_EXECUTABLE_PATH");
    }
    if (!env.value("CHROME_WS_ENDPOINT").isEmpty()) {
        browserEndpoint = env.value("CHROME_WS_ENDPOINT");
    }
}

ExportConfigFile::ExportConfigFile(QObject* parent) : QObject(parent) {}
ExportConfigFile::~ExportConfigFile() = default;

bool ExportConfigFile::save(const QString& filePath, const ExportConfig& config) {
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }

    file.write(QJsonDocument(toJson(config)).toJson());
    return true;
}

bool ExportConfigFile::load(const QString& filePath, ExportConfig& config) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        m_error = QString("Invalid config format: %1").arg(parseError.errorString());
        return false;
    }

    config = fromJson(doc.object());
    return true;
}

QJsonObject ExportConfigFile::toJson(const ExportConfig& config) {
    QJsonObject obj;
    obj["version"] = 1;
    obj["baseUrl"] = config.baseUrl;
    obj["uploadFrames"] = config.uploadFrames;
    obj["flipDuration"] = config.flipDuration;

    QJsonObject capture;
    capture["navigationTimeoutMs"] = config.capture.navigationTimeoutMs;
    capture["readyTimeoutMs"] = config.capture.readyTimeoutMs;
    capture["readyPollMs"] = config.capture.readyPollMs;
    capture["settleDelayMs"] = config.capture.settleDelayMs;
    capture["jpegQuality"] = config.capture.jpegQuality;
    capture["highlightInterval"] = config.capture.plan.highlightInterval;
    capture["flipFrameCount"] = config.capture.plan.flipFrameCount;
    obj["capture"] = capture;

    QJsonObject encoder;
    encoder["fps"] = config.encoder.fps;
    encoder["preset"] = config.encoder.preset;
    encoder["crf"] = config.encoder.crf;
    encoder["audioBitrate"] = config.encoder.audioBitrate;
    obj["encoder"] = encoder;

    obj["ffmpegPath"] = config.ffmpegPath;
    obj["browserEndpoint"] = config.browserEndpoint;
    obj["browserExecutable"] = config.browserExecutable;
    obj["browserLaunchTimeoutMs"] = config.browserLaunchTimeoutMs;
    obj["tempRoot"] = config.tempRoot;

    QJsonObject store;
    store["directory"] = config.storeDirectory;
    store["url"] = config.storeUrl;
    store["token"] = config.storeToken;
    obj["store"] = store;

    obj["keepOutputOnUploadFailure"] = config.keepOutputOnUploadFailure;
    obj["recoveryDir"] = config.recoveryDir;
    return obj;
}

ExportConfig ExportConfigFile::fromJson(const QJsonObject& obj) {
    ExportConfig cfg;
    cfg.baseUrl = obj["baseUrl"].toString();
    cfg.uploadFrames = obj["uploadFrames"].toBool(cfg.uploadFrames);
    cfg.flipDuration = obj["flipDuration"].toDouble(cfg.flipDuration);

    const QJsonObject capture = obj["capture"].toObject();
    cfg.capture.navigationTimeoutMs = capture["navigationTimeoutMs"].toInt(cfg.capture.navigationTimeoutMs);
    cfg.capture.readyTimeoutMs = capture["readyTimeoutMs"].toInt(cfg.capture.readyTimeoutMs);
    cfg.capture.readyPollMs = capture["readyPollMs"].toInt(cfg.capture.readyPollMs);
    cfg.capture.settleDelayMs = capture["settleDelayMs"].toInt(cfg.capture.settleDelayMs);
    cfg.capture.jpegQuality = std::clamp(capture["jpegQuality"].toInt(cfg.capture.jpegQuality),
                                         AppConstants::MinJpegQuality, AppConstants::MaxJpegQuality);
    cfg.capture.plan.highlightInterval = capture["highlightInterval"].toDouble(cfg.capture.plan.highlightInterval);
    cfg.capture.plan.flipFrameCount = capture["flipFrameCount"].toInt(cfg.capture.plan.flipFrameCount);

    const QJsonObject encoder = obj["encoder"].toObject();
    cfg.encoder.fps = encoder["fps"].toInt(cfg.encoder.fps);
    cfg.encoder.preset = encoder["preset"].toString(cfg.encoder.preset);
    cfg.encoder.crf = encoder["crf"].toInt(cfg.encoder.crf);
    cfg.encoder.audioBitrate = encoder["audioBitrate"].toString(cfg.encoder.audioBitrate);

    cfg.ffmpegPath = obj["ffmpegPath"].toString();
    cfg.browserEndpoint = obj["browserEndpoint"].toString();
    cfg.browserExecutable = obj["browserExecutable"].toString();
    cfg.browserLaunchTimeoutMs = obj["browserLaunchTimeoutMs"].toInt(cfg.browserLaunchTimeoutMs);
    cfg.tempRoot = obj["tempRoot"].toString();

    const QJsonObject store = obj["store"].toObject();
    cfg.storeDirectory = store["directory"].toString();
    cfg.storeUrl = store["url"].toString();
    cfg.storeToken = store["token"].toString();

    cfg.keepOutputOnUploadFailure = obj["keepOutputOnUploadFailure"].toBool(cfg.keepOutputOnUploadFailure);
    cfg.recoveryDir = obj["recoveryDir"].toString();
    return cfg;
}
