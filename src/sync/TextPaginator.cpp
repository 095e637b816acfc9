#include "TextPaginator.h"

#include <QRegularExpression>
#include <QStringList>
#include <cmath>

namespace {

double averageCharWidth(FontSize size) {
    switch (size) {
        case FontSize::XS:   return 7.0;
        case FontSize::SM:   return 7.5;
        case FontSize::Base: return 8.5;
        case FontSize::LG:   return 10.0;
        case FontSize::XL:   return 11.5;
        case FontSize::XXL:  return 13.0;
    }
    return 8.5;
}

double lineHeight(FontSize size) {
    switch (size) {
        case FontSize::XS:   return 22.0;
        case FontSize::SM:   return 24.0;
        case FontSize::Base: return 28.0;
        case FontSize::LG:   return 34.0;
        case FontSize::XL:   return 42.0;
        case FontSize::XXL:  return 50.0;
    }
    return 28.0;
}

struct Paragraph {
    QString text;   // trimmed
    int start = 0;
    int end = 0;
};

int linesFor(int length, int charsPerLine) {
    return static_cast<int>(std::ceil(static_cast<double>(length) / charsPerLine));
}

} // namespace

TextPaginator::TextPaginator(double pageWidth, double pageHeight)
    : m_pageWidth(pageWidth), m_pageHeight(pageHeight) {}

int TextPaginator::charsPerLine(FontSize fontSize) const {
    return qMax(1, static_cast<int>(std::floor(m_pageWidth / averageCharWidth(fontSize))));
}

int TextPaginator::linesPerPage(FontSize fontSize) const {
    return qMax(1, static_cast<int>(std::floor(m_pageHeight / lineHeight(fontSize))));
}

PaginatedContent TextPaginator::paginate(const QString& content, FontSize fontSize) const {
    const int cpl = charsPerLine(fontSize);
    const int lpp = linesPerPage(fontSize);

    // Paragraphs keep their offsets into the original content
    static const QRegularExpression paragraphBreak(QStringLiteral("\n\n+"));
    std::vector<Paragraph> paragraphs;
    int globalIndex = 0;
    for (const QString& part : content.split(paragraphBreak)) {
        int start = content.indexOf(part, globalIndex);
        if (start < 0) start = globalIndex;
        globalIndex = start + part.length();

        // Range covers the trimmed text only
        int lead = 0;
        while (lead < part.length() && part.at(lead).isSpace()) ++lead;

        Paragraph p;
        p.text = part.trimmed();
        p.start = start + lead;
        p.end = p.start + p.text.length();
        if (!p.text.isEmpty()) {
            paragraphs.push_back(p);
        }
    }

    PaginatedContent result;
    std::vector<TextChunk> currentPage;
    int currentLineCount = 0;

    auto flushPage = [&]() {
        result.pages.push_back(std::move(currentPage));
        currentPage.clear();
        currentLineCount = 0;
    };

    for (const Paragraph& paragraph : paragraphs) {
        const int estimatedLines = linesFor(paragraph.text.length(), cpl) + 1;

        if (currentLineCount + estimatedLines > lpp && !currentPage.empty()) {
            flushPage();
        }

        if (estimatedLines <= lpp) {
            TextChunk chunk;
            chunk.text = paragraph.text;
            chunk.startCharIndex = paragraph.start;
            chunk.endCharIndex = paragraph.end;
            chunk.isParagraphStart = true;
            currentPage.push_back(chunk);
            currentLineCount += estimatedLines;
            continue;
        }

        // Paragraph longer than a page: split on spaces
        QString chunk;
        int chunkLines = 0;
        int chunkStart = paragraph.start;
        for (const QString& word : paragraph.text.split(QChar(' '))) {
            const QString candidate = chunk.isEmpty() ? word : chunk + QChar(' ') + word;
            const int candidateLines = linesFor(candidate.length(), cpl);

            if (candidateLines > lpp - currentLineCount) {
                if (!chunk.isEmpty()) {
                    TextChunk piece;
                    piece.text = chunk;
                    piece.startCharIndex = chunkStart;
                    piece.endCharIndex = chunkStart + chunk.length();
                    piece.isParagraphStart = chunkStart == paragraph.start;
                    currentPage.push_back(piece);
                    flushPage();
                    chunkStart += chunk.length() + 1;
                }
                chunk = word;
                chunkLines = linesFor(word.length(), cpl);
            } else {
                chunk = candidate;
                chunkLines = candidateLines;
            }
        }

        if (!chunk.isEmpty()) {
            TextChunk piece;
            piece.text = chunk;
            piece.startCharIndex = chunkStart;
            piece.endCharIndex = chunkStart + chunk.length();
            piece.isParagraphStart = chunkStart == paragraph.start;
            currentPage.push_back(piece);
            currentLineCount += chunkLines + 1;
        }
    }

    if (!currentPage.empty()) {
        flushPage();
    }

    // Always at least one (possibly empty) page
    if (result.pages.empty()) {
        result.pages.emplace_back();
    }

    result.totalPages = static_cast<int>(result.pages.size());
    return result;
}
