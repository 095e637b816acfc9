#include "SyncTypes.h"

namespace {

struct FontSizeName {
    FontSize size;
    const char* name;
};

constexpr FontSizeName FontSizeNames[] = {
    {FontSize::XS, "xs"},
    {FontSize::SM, "sm"},
    {FontSize::Base, "base"},
    {FontSize::LG, "lg"},
    {FontSize::XL, "xl"},
    {FontSize::XXL, "xxl"},
};

struct ThemeName {
    ReadingTheme theme;
    const char* name;
};

constexpr ThemeName ThemeNames[] = {
    {ReadingTheme::Day, "day"},
    {ReadingTheme::Night, "night"},
    {ReadingTheme::Sepia, "sepia"},
    {ReadingTheme::Focus, "focus"},
};

} // namespace

QString fontSizeName(FontSize size) {
    for (const auto& entry : FontSizeNames) {
        if (entry.size == size) return QString::fromLatin1(entry.name);
    }
    return QStringLiteral("base");
}

bool fontSizeFromName(const QString& name, FontSize& size) {
    for (const auto& entry : FontSizeNames) {
        if (name.compare(QLatin1String(entry.name), Qt::CaseInsensitive) == 0) {
            size = entry.size;
            return true;
        }
    }
    return false;
}

QString themeName(ReadingTheme theme) {
    for (const auto& entry : ThemeNames) {
        if (entry.theme == theme) return QString::fromLatin1(entry.name);
    }
    return QStringLiteral("day");
}

bool themeFromName(const QString& name, ReadingTheme& theme) {
    for (const auto& entry : ThemeNames) {
        if (name.compare(QLatin1String(entry.name), Qt::CaseInsensitive) == 0) {
            theme = entry.theme;
            return true;
        }
    }
    return false;
}
