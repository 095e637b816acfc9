#include "ManifestJson.h"

#include <QJsonArray>

namespace ManifestJson {

QJsonObject pageToJson(const PageTiming& page) {
    QJsonObject obj;
    obj["pageIndex"] = page.pageIndex;
    obj["startTime"] = page.startTime;
    obj["endTime"] = page.endTime;
    obj["duration"] = page.duration;
    obj["startWordIndex"] = page.startWordIndex;
    obj["endWordIndex"] = page.endWordIndex;
    obj["startCharIndex"] = page.startCharIndex;
    obj["endCharIndex"] = page.endCharIndex;
    return obj;
}

QJsonObject flipToJson(const FlipTransition& flip) {
    QJsonObject obj;
    obj["fromPage"] = flip.fromPage;
    obj["toPage"] = flip.toPage;
    obj["startTime"] = flip.startTime;
    obj["endTime"] = flip.endTime;
    obj["duration"] = flip.duration;
    return obj;
}

QJsonObject chapterToJson(const ChapterTiming& chapter) {
    QJsonArray pages;
    for (const auto& page : chapter.pages) {
        pages.append(pageToJson(page));
    }
    QJsonArray flips;
    for (const auto& flip : chapter.flipTransitions) {
        flips.append(flipToJson(flip));
    }

    QJsonObject obj;
    obj["chapterIndex"] = chapter.chapterIndex;
    obj["chapterTitle"] = chapter.chapterTitle;
    obj["totalPages"] = chapter.totalPages;
    obj["audioDuration"] = chapter.audioDuration;
    obj["timeOffset"] = chapter.timeOffset;
    obj["hasTimestamps"] = chapter.hasTimestamps;
    obj["pages"] = pages;
    obj["flipTransitions"] = flips;
    return obj;
}

QJsonObject manifestToJson(const VideoManifest& manifest) {
    QJsonArray chapters;
    for (const auto& chapter : manifest.chapters) {
        chapters.append(chapterToJson(chapter));
    }

    QJsonObject obj;
    obj["bookId"] = manifest.bookId;
    obj["bookTitle"] = manifest.bookTitle;
    obj["author"] = manifest.author;
    obj["totalDuration"] = manifest.totalDuration;
    obj["totalFrames"] = manifest.totalFrames;
    obj["fontSize"] = fontSizeName(manifest.fontSize);
    obj["theme"] = themeName(manifest.theme);
    obj["chapters"] = chapters;
    return obj;
}

QJsonObject estimateToJson(const ExportEstimate& estimate) {
    QJsonObject obj;
    obj["estimatedMinutes"] = estimate.estimatedMinutes;
    obj["estimatedSizeMB"] = estimate.estimatedSizeMB;
    obj["estimatedDurationMinutes"] = estimate.estimatedDurationMinutes;
    obj["totalFrames"] = estimate.totalFrames;
    obj["totalDuration"] = estimate.totalDuration;
    return obj;
}

} // namespace ManifestJson
