#pragma once

#include <QString>
#include <vector>
#include "SyncTypes.h"

struct TextChunk {
    QString text;
    int startCharIndex = 0;
    int endCharIndex = 0;
    bool isParagraphStart = false;
};

struct PaginatedContent {
    std::vector<std::vector<TextChunk>> pages;
    int totalPages = 0;
};

// Splits chapter text into pages of character-range chunks.
// Implementations must be pure: identical input yields identical pages.
class Paginator {
public:
    virtual ~Paginator() = default;
    virtual PaginatedContent paginate(const QString& content, FontSize fontSize) const = 0;
};
