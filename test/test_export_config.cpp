#include <cassert>
#include <cstdio>
#include <QCoreApplication>
#include <QDir>
#include <QTemporaryDir>
#include "export/ExportConfig.h"
#include "export/ExportTypes.h"

void test_defaults() {
    ExportConfig config;
    assert(!config.uploadFrames);
    assert(config.capture.jpegQuality == 85);
    assert(config.capture.plan.flipFrameCount == 15);
    assert(config.capture.plan.highlightInterval == 0.5);
    assert(config.flipDuration == 0.6);
    assert(config.encoder.fps == 24);
    assert(config.encoder.crf == 23);
    assert(config.encoder.preset == "medium");
    assert(config.encoder.audioBitrate == "192k");
    assert(config.capture.frameWidth == 1920 && config.capture.frameHeight == 1080);
    printf("PASS: test_defaults\n");
}

void test_save_load_roundtrip() {
    QTemporaryDir dir;
    const QString path = QDir(dir.path()).filePath("export.json");

    ExportConfig config;
    config.baseUrl = "http://localhost:5000";
    config.uploadFrames = true;
    config.capture.jpegQuality = 70;
    config.capture.readyTimeoutMs = 2500;
    config.capture.plan.highlightInterval = 1.0;
    config.encoder.crf = 20;
    config.ffmpegPath = "/opt/ffmpeg/bin/ffmpeg";
    config.storeDirectory = "/srv/exports";
    config.storeToken = "secret";
    config.keepOutputOnUploadFailure = true;

    ExportConfigFile file;
    assert(file.save(path, config));

    ExportConfig loaded;
    assert(file.load(path, loaded));
    assert(loaded.baseUrl == config.baseUrl);
    assert(loaded.uploadFrames);
    assert(loaded.capture.jpegQuality == 70);
    assert(loaded.capture.readyTimeoutMs == 2500);
    assert(loaded.capture.plan.highlightInterval == 1.0);
    assert(loaded.encoder.crf == 20);
    assert(loaded.ffmpegPath == config.ffmpegPath);
    assert(loaded.storeDirectory == "/srv/exports");
    assert(loaded.storeToken == "secret");
    assert(loaded.keepOutputOnUploadFailure);
    printf("PASS: test_save_load_roundtrip\n");
}

void test_missing_keys_keep_defaults() {
    QJsonObject obj;
    obj["baseUrl"] = "http://render";
    QJsonObject capture;
    capture["jpegQuality"] = 150;
    obj["capture"] = capture;

    ExportConfig config = ExportConfigFile::fromJson(obj);
    assert(config.baseUrl == "http://render");
    assert(config.capture.jpegQuality == 95);
    assert(config.capture.navigationTimeoutMs == 60000);
    assert(config.capture.plan.flipFrameCount == 15);
    assert(config.encoder.fps == 24);
    printf("PASS: test_missing_keys_keep_defaults\n");
}

void test_load_errors() {
    ExportConfigFile file;
    ExportConfig config;
    assert(!file.load("/nonexistent/bookreel.json", config));
    assert(file.errorString().contains("Cannot read"));
    printf("PASS: test_load_errors\n");
}

void test_environment_overlay() {
    ExportConfig config;
    config.ffmpegPath = "/configured/ffmpeg";

    QProcessEnvironment env;
    env.insert("BOOKREEL_UPLOAD_FRAMES", "true");
    env.insert("BOOKREEL_JPEG_QUALITY", "10");
    env.insert("CHROME_EXECUTABLE_PATH", "/usr/lib/chromium/chromium");
    env.insert("CHROME_WS_ENDPOINT", "ws://browser:9222/devtools/browser/abc");
    config.applyEnvironment(env);

    assert(config.uploadFrames);
    assert(config.capture.jpegQuality == 30);
    assert(config.ffmpegPath == "/configured/ffmpeg");
    assert(config.browserExecutable == "/usr/lib/chromium/chromium");
    assert(config.browserEndpoint == "ws://browser:9222/devtools/browser/abc");

    QProcessEnvironment off;
    off.insert("BOOKREEL_UPLOAD_FRAMES", "no");
    off.insert("BOOKREEL_JPEG_QUALITY", "high");
    off.insert("FFMPEG_PATH", "/env/ffmpeg");
    config.applyEnvironment(off);
    assert(!config.uploadFrames);
    assert(config.capture.jpegQuality == 30);
    assert(config.ffmpegPath == "/env/ffmpeg");
    printf("PASS: test_environment_overlay\n");
}

void test_type_names() {
    assert(exportPhaseName(ExportPhase::RenderingFrames) == "rendering_frames");
    assert(exportPhaseName(ExportPhase::Complete) == "complete");
    assert(exportErrorName(ExportError::RenderTimeout) == "render_timeout");
    assert(exportErrorName(ExportError::AudioPreparation) == "audio_preparation");

    ExportScope scope = ExportScope::Full;
    assert(exportScopeFromName("chapter", scope));
    assert(scope == ExportScope::Chapter);
    assert(exportScopeName(scope) == "chapter");
    assert(!exportScopeFromName("volume", scope));
    assert(scope == ExportScope::Chapter);
    printf("PASS: test_type_names\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_defaults();
    test_save_load_roundtrip();
    test_missing_keys_keep_defaults();
    test_load_errors();
    test_environment_overlay();
    test_type_names();
    printf("All export config tests passed.\n");
    return 0;
}
