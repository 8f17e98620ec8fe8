#include <cassert>
#include <cstdio>
#include <QDir>
#include <QGuiApplication>
#include <QImage>
#include <QTemporaryDir>
#include "media/ImageUtil.h"
#include "overlay/TextComposer.h"
#include "overlay/ThumbnailComposer.h"

void test_wrap_text() {
    QStringList lines = TextComposer::wrapText("the quick brown fox jumps over the lazy dog", 10);
    assert(lines == QStringList({"the quick", "brown fox", "jumps over", "the lazy", "dog"}));
    for (const QString& line : lines) {
        assert(line.size() <= 10);
    }

    lines = TextComposer::wrapText("supercalifragilistic", 8);
    assert(lines == QStringList({"supercal", "ifragili", "stic"}));

    assert(TextComposer::wrapText("   ", 10).isEmpty());
    assert(TextComposer::wrapText("short", 35) == QStringList({"short"}));
    printf("PASS: test_wrap_text\n");
}

void test_transparent_placeholder() {
    QTemporaryDir dir;
    const QString path = dir.filePath("png/trs0.png");
    QString error;
    assert(ImageUtil::writeTransparentPlaceholder(path, 486, 486, &error));

    QImage img(path);
    assert(!img.isNull());
    assert(img.size() == QSize(486, 486));
    assert(img.hasAlphaChannel());
    assert(qAlpha(img.pixel(0, 0)) == 0);
    assert(qAlpha(img.pixel(485, 485)) == 0);
    printf("PASS: test_transparent_placeholder\n");
}

void test_parse_color() {
    assert(ImageUtil::parseColor("255,255,255", Qt::black) == QColor(255, 255, 255));
    assert(ImageUtil::parseColor("10, 20, 30, 40", Qt::black) == QColor(10, 20, 30, 40));
    assert(ImageUtil::parseColor("#000000", Qt::white) == QColor(0, 0, 0));
    assert(ImageUtil::parseColor("White", Qt::black) == QColor(Qt::white));
    assert(ImageUtil::parseColor("300,0,0", Qt::red) == QColor(Qt::red));
    assert(ImageUtil::parseColor("", Qt::blue) == QColor(Qt::blue));
    printf("PASS: test_parse_color\n");
}

void test_title_card_grows_with_text() {
    QImage base(600, 300, QImage::Format_ARGB32);
    base.fill(Qt::white);

    TextStyle style;
    style.pixelSize = 30;
    style.wrapWidth = 20;

    TextComposer composer;
    QImage shortCard = composer.composeTitleCard(base, "Short", style, "Channel");
    QImage longCard = composer.composeTitleCard(
        base, "A considerably longer title that needs several lines to fit", style, "Channel");
    assert(!shortCard.isNull() && !longCard.isNull());
    assert(shortCard.width() == 600);
    assert(longCard.height() > shortCard.height());
    printf("PASS: test_title_card_grows_with_text\n");
}

void test_thumbnail() {
    QTemporaryDir dir;
    ThumbnailStyle style;
    style.fontSize = 24;

    TextComposer text;
    ThumbnailComposer composer(&text);
    QImage thumb;
    assert(!composer.compose(dir.path(), "Title", style, thumb));
    assert(!composer.errorString().isEmpty());

    QImage bg(320, 180, QImage::Format_RGB32);
    bg.fill(Qt::darkGray);
    assert(bg.save(QDir(dir.path()).filePath("b.png")));
    assert(bg.save(QDir(dir.path()).filePath("a.png")));
    assert(ThumbnailComposer::findBaseImage(dir.path()).endsWith("a.png"));

    const QString out = QDir(dir.path()).filePath("thumbnails/t.png");
    assert(composer.composeToFile(dir.path(), "Title", style, out));
    QImage saved(out);
    assert(saved.size() == QSize(320, 180));
    printf("PASS: test_thumbnail\n");
}

int main(int argc, char* argv[]) {
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);

    test_wrap_text();
    test_transparent_placeholder();
    test_parse_color();
    test_title_card_grows_with_text();
    test_thumbnail();
    printf("All text composer tests passed.\n");
    return 0;
}
