#pragma once

#include <QString>

namespace AppConstants {
    inline constexpr const char* AppName = "BookReel";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "BookReel";

    // Render surface output (1080p video)
    inline constexpr int FrameWidth = 1920;
    inline constexpr int FrameHeight = 1080;

    // Render surface contract
    inline constexpr const char* RenderPath = "/render/book/";
    inline constexpr const char* ReadyFlagExpression = "window.__RENDER_READY__ === true";
    inline constexpr const char* RenderContainerSelector = "#render-container";
    inline constexpr const char* BookApiPath = "/api/books/";

    // Timing defaults
    inline constexpr double DefaultFlipDuration = 0.6;       // seconds
    inline constexpr int DefaultFlipFrameCount = 15;
    inline constexpr double DefaultHighlightInterval = 0.5;  // seconds between word-sync frames
    inline constexpr double MinPageDuration = 0.1;

    // Capture defaults
    inline constexpr int DefaultNavigationTimeoutMs = 60000;
    inline constexpr int DefaultReadyTimeoutMs = 10000;
    inline constexpr int DefaultReadyPollMs = 100;
    inline constexpr int DefaultSettleDelayMs = 50;
    inline constexpr int DefaultJpegQuality = 85;
    inline constexpr int MinJpegQuality = 30;
    inline constexpr int MaxJpegQuality = 95;

    // Encoder profile
    inline constexpr int DefaultFps = 24;
    inline constexpr int DefaultCrf = 23;

    // Object store layout
    inline constexpr const char* ExportPrefix = "video-exports";
}
