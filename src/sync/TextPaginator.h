#pragma once

#include "Paginator.h"

// Character-metric paginator matching the reader's two-page book layout.
// Estimates line usage from average glyph width and line height per font
// size; long paragraphs are split on word boundaries across pages.
class TextPaginator : public Paginator {
public:
    explicit TextPaginator(double pageWidth = DefaultPageWidth,
                           double pageHeight = DefaultPageHeight);

    PaginatedContent paginate(const QString& content, FontSize fontSize) const override;

    int charsPerLine(FontSize fontSize) const;
    int linesPerPage(FontSize fontSize) const;

    static constexpr double DefaultPageWidth = 440.0;
    static constexpr double DefaultPageHeight = 580.0;

private:
    double m_pageWidth;
    double m_pageHeight;
};
