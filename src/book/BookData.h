#pragma once

#include <QString>
#include <QtGlobal>
#include <vector>
#include "SyncTypes.h"

struct ChapterData {
    int chapterNumber = 0;        // 1-based, as shown to readers
    QString title;
    QString content;
    QString audioUrl;             // empty when the chapter has no narration
    double audioDuration = 0.0;   // seconds
    std::vector<AudioTimestamp> audioTimestamps;

    bool hasAudio() const { return !audioUrl.isEmpty(); }
};

struct BookData {
    qint64 id = 0;
    QString title;
    QString author;
    std::vector<ChapterData> chapters;

    // Array index of the chapter with the given number, or -1.
    int chapterIndexForNumber(int chapterNumber) const {
        for (size_t i = 0; i < chapters.size(); ++i) {
            if (chapters[i].chapterNumber == chapterNumber) return static_cast<int>(i);
        }
        return -1;
    }
};
