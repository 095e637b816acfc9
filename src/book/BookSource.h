#pragma once

#include <QString>
#include <QtGlobal>
#include "BookData.h"

// Read-only access to stored books. The export pipeline never writes back.
class BookSource {
public:
    virtual ~BookSource() = default;

    virtual bool loadBook(qint64 bookId, BookData& book) = 0;
    virtual QString errorString() const = 0;
};
