#include <cassert>
#include <cstdio>
#include <QBuffer>
#include "util/ConsoleProgress.h"

static QByteArray render(void (*drive)(ConsoleProgress&)) {
    QBuffer buffer;
    buffer.open(QIODevice::WriteOnly);
    ConsoleProgress progress(&buffer, 10);
    drive(progress);
    return buffer.data();
}

void test_completion_ends_line_once() {
    QByteArray out = render([](ConsoleProgress& p) {
        p.update("main", 0.5);
        p.update("main", 1.02);
        p.update("main", 1.0);
        p.finish();
        p.finish();
    });
    assert(out.count('\n') == 1);
    assert(out.endsWith("100.00%\n"));
    assert(out.contains("[#####-----] Progress: 50.00%"));
    assert(!out.contains("102"));
    printf("PASS: test_completion_ends_line_once\n");
}

void test_new_label_starts_new_line() {
    QByteArray out = render([](ConsoleProgress& p) {
        p.update("main", 1.0);
        p.update("audio-only", 0.25);
        p.finish();
    });
    assert(out.count('\n') == 2);
    assert(out.contains("100.00%\n\raudio-only"));
    printf("PASS: test_new_label_starts_new_line\n");
}

void test_finish_without_updates_writes_nothing() {
    QByteArray out = render([](ConsoleProgress& p) { p.finish(); });
    assert(out.isEmpty());
    printf("PASS: test_finish_without_updates_writes_nothing\n");
}

int main() {
    test_completion_ends_line_once();
    test_new_label_starts_new_line();
    test_finish_without_updates_writes_nothing();
    printf("All console progress tests passed.\n");
    return 0;
}
