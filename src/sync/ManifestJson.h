#pragma once

#include <QJsonObject>
#include "SyncTypes.h"

namespace ManifestJson {

QJsonObject pageToJson(const PageTiming& page);
QJsonObject flipToJson(const FlipTransition& flip);
QJsonObject chapterToJson(const ChapterTiming& chapter);
QJsonObject manifestToJson(const VideoManifest& manifest);
QJsonObject estimateToJson(const ExportEstimate& estimate);

} // namespace ManifestJson
