#pragma once

#include <QString>
#include <QtGlobal>
#include <vector>

// One narrated word as produced by the narration aligner.
// Lists are ordered by start and do not overlap.
struct AudioTimestamp {
    QString word;
    double start = 0.0;   // seconds
    double end = 0.0;     // seconds
};

enum class FontSize {
    XS,
    SM,
    Base,
    LG,
    XL,
    XXL
};

enum class ReadingTheme {
    Day,
    Night,
    Sepia,
    Focus
};

QString fontSizeName(FontSize size);
bool fontSizeFromName(const QString& name, FontSize& size);
QString themeName(ReadingTheme theme);
bool themeFromName(const QString& name, ReadingTheme& theme);

struct PageTiming {
    int pageIndex = 0;         // page within the chapter (0-based)
    double startTime = 0.0;    // seconds
    double endTime = 0.0;
    double duration = 0.0;
    int startWordIndex = 0;
    int endWordIndex = 0;
    int startCharIndex = 0;
    int endCharIndex = 0;
};

// Page-turn animation between two spreads, centred on the spread boundary.
struct FlipTransition {
    int fromPage = 0;
    int toPage = 0;
    double startTime = 0.0;
    double endTime = 0.0;
    double duration = 0.0;
};

struct ChapterTiming {
    int chapterIndex = 0;
    QString chapterTitle;
    int totalPages = 0;
    double audioDuration = 0.0;
    double timeOffset = 0.0;      // chapter start in video time
    bool hasTimestamps = false;   // word-level sampling applies
    std::vector<PageTiming> pages;
    std::vector<FlipTransition> flipTransitions;
};

struct VideoManifest {
    qint64 bookId = 0;
    QString bookTitle;
    QString author;
    double totalDuration = 0.0;
    int totalFrames = 0;
    std::vector<ChapterTiming> chapters;
    FontSize fontSize = FontSize::Base;
    ReadingTheme theme = ReadingTheme::Day;
};

// Chapter input for manifest construction.
struct ChapterInput {
    int index = 0;
    QString title;
    QString content;
    std::vector<AudioTimestamp> timestamps;
    double audioDuration = 0.0;
};

struct ExportEstimate {
    int estimatedMinutes = 0;
    int estimatedSizeMB = 0;
    double estimatedDurationMinutes = 0.0;
    int totalFrames = 0;
    double totalDuration = 0.0;
};
