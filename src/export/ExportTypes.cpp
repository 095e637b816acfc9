#include "ExportTypes.h"

QString exportPhaseName(ExportPhase phase) {
    switch (phase) {
    case ExportPhase::Initializing:    return "initializing";
    case ExportPhase::RenderingFrames: return "rendering_frames";
    case ExportPhase::Downloading:     return "downloading";
    case ExportPhase::Stitching:       return "stitching";
    case ExportPhase::Uploading:       return "uploading";
    case ExportPhase::Complete:        return "complete";
    case ExportPhase::Error:           return "error";
    }
    return QString();
}

QString exportErrorName(ExportError error) {
    switch (error) {
    case ExportError::None:                return "none";
    case ExportError::Manifest:            return "manifest";
    case ExportError::RenderTimeout:       return "render_timeout";
    case ExportError::RenderTargetMissing: return "render_target_missing";
    case ExportError::BrowserLaunch:       return "browser_launch";
    case ExportError::AudioPreparation:    return "audio_preparation";
    case ExportError::Encode:              return "encode";
    case ExportError::Upload:              return "upload";
    case ExportError::Capture:             return "capture";
    case ExportError::Cancelled:           return "cancelled";
    }
    return QString();
}

QString exportScopeName(ExportScope scope) {
    return scope == ExportScope::Chapter ? QStringLiteral("chapter") : QStringLiteral("full");
}

bool exportScopeFromName(const QString& name, ExportScope& scope) {
    if (name == "full") {
        scope = ExportScope::Full;
    } else if (name == "chapter") {
        scope = ExportScope::Chapter;
    } else {
        return false;
    }
    return true;
}
