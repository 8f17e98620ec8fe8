#include <cassert>
#include <cstdio>
#include <vector>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QGuiApplication>
#include <QImage>
#include <QTemporaryDir>
#include "app/ContentDescriptor.h"
#include "app/VideoAssembler.h"
#include "media/DurationProbe.h"
#include "render/EncoderProcess.h"

class FixedProbe : public DurationProbe {
public:
    bool probeDuration(const QString&, double& seconds) override {
        seconds = 2.0;
        return true;
    }
    QString errorString() const override { return QString(); }
};

class RecordingEncoder : public EncoderProcess {
public:
    std::vector<QStringList> calls;
    int failOnCall = -1;

    EncodeResult execute(const QStringList& arguments) override {
        EncodeResult result;
        result.started = true;
        result.exitCode = (static_cast<int>(calls.size()) == failOnCall) ? 1 : 0;
        calls.push_back(arguments);
        return result;
    }
};

static void touch(const QString& path) {
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    bool opened = file.open(QIODevice::WriteOnly);
    assert(opened);
    file.write("x");
}

// Scratch directory for a flat-comments job with two comments
struct Workspace {
    QTemporaryDir root;
    RenderSettings settings;

    explicit Workspace(LayoutMode mode = LayoutMode::FlatComments, int items = 2) {
        settings.layoutMode = mode;
        settings.paths.scratchRoot = root.filePath("temp");
        settings.paths.resultsRoot = root.filePath("results");
        settings.paths.category = "AskReddit";
        settings.title.templatePath = root.filePath("no-template.png");
        settings.background.credit.clear();

        ScratchLayout layout(settings.paths.scratchRoot, "job1");
        touch(layout.backgroundVideo());
        touch(layout.backgroundAudio());
        touch(layout.titleAudio());
        touch(layout.titleImage());
        const int bodies = (mode == LayoutMode::StoryTitleAndBody) ? 1 : items;
        for (int i = 0; i < bodies; ++i) {
            touch(layout.bodyAudio(mode, i));
            if (mode != LayoutMode::StoryPerParagraphBlank)
                touch(layout.bodyImage(mode, i));
        }
    }

    AssemblyRequest request(int items = 2) const {
        AssemblyRequest r;
        r.jobId = "job1";
        r.title = "What is your w/o story?";
        r.itemCount = items;
        return r;
    }
};

void test_silent_background_skips_audio_only() {
    Workspace ws;
    ws.settings.background.audioVolume = 0.0;
    ws.settings.background.enableExtraAudio = true;

    FixedProbe probe;
    RecordingEncoder encoder;
    VideoAssembler assembler(ws.settings, &probe, &encoder);
    assembler.setPollInterval(20);
    assert(assembler.assemble(ws.request()));

    assert(encoder.calls.size() == 1);
    const QStringList& args = encoder.calls.front();
    assert(!args[args.indexOf("-filter_complex") + 1].contains("amix"));
    assert(!args.join(' ').contains("background.mp3"));

    const QString expected = QDir(ws.settings.paths.resultsRoot)
                                 .filePath("AskReddit/What is your without story.mp4");
    assert(args.last() == expected);
    assert(assembler.producedPaths() == QStringList({expected}));
    assert(!QFileInfo::exists(QDir(ws.settings.paths.resultsRoot).filePath("AskReddit/OnlyTTS")));
    assert(qAbs(assembler.videoLength() - 6.0) < 1e-9);
    printf("PASS: test_silent_background_skips_audio_only\n");
}

void test_audio_only_variant_renders_second() {
    Workspace ws;
    ws.settings.background.audioVolume = 0.2;
    ws.settings.background.enableExtraAudio = true;

    FixedProbe probe;
    RecordingEncoder encoder;
    VideoAssembler assembler(ws.settings, &probe, &encoder);
    assembler.setPollInterval(20);

    std::vector<RenderVariant> finished;
    QObject::connect(&assembler, &VideoAssembler::progress, &assembler,
                     [&finished](RenderVariant variant, double fraction) {
                         if (fraction >= 1.0) finished.push_back(variant);
                     }, Qt::DirectConnection);

    assert(assembler.assemble(ws.request()));
    assert(encoder.calls.size() == 2);
    assert(encoder.calls[0].join(' ').contains("amix"));
    assert(!encoder.calls[1].join(' ').contains("amix"));
    assert(encoder.calls[1].last().contains("OnlyTTS"));
    assert(assembler.producedPaths().size() == 2);
    assert(finished.size() == 2);
    assert(finished[0] == RenderVariant::Main && finished[1] == RenderVariant::AudioOnly);
    printf("PASS: test_audio_only_variant_renders_second\n");
}

void test_main_failure_skips_audio_only() {
    Workspace ws;
    ws.settings.background.audioVolume = 0.2;
    ws.settings.background.enableExtraAudio = true;

    FixedProbe probe;
    RecordingEncoder encoder;
    encoder.failOnCall = 0;
    VideoAssembler assembler(ws.settings, &probe, &encoder);
    assembler.setPollInterval(20);

    assert(!assembler.assemble(ws.request()));
    assert(assembler.error() == RenderError::Encode);
    assert(encoder.calls.size() == 1);
    assert(assembler.producedPaths().isEmpty());
    printf("PASS: test_main_failure_skips_audio_only\n");
}

void test_blank_mode_writes_placeholders() {
    Workspace ws(LayoutMode::StoryPerParagraphBlank, 3);
    ws.settings.background.audioVolume = 0.0;

    FixedProbe probe;
    RecordingEncoder encoder;
    VideoAssembler assembler(ws.settings, &probe, &encoder);
    assembler.setPollInterval(20);
    assert(assembler.assemble(ws.request(3)));

    ScratchLayout layout(ws.settings.paths.scratchRoot, "job1");
    for (int i = 0; i < 3; ++i) {
        QImage card(layout.bodyImage(LayoutMode::StoryPerParagraphBlank, i));
        assert(!card.isNull());
        assert(card.width() == 486 && card.height() == 486);
        assert(qAlpha(card.pixel(10, 10)) == 0);
    }
    assert(encoder.calls.size() == 1);
    assert(!encoder.calls.front().join(' ').contains("colorchannelmixer"));
    printf("PASS: test_blank_mode_writes_placeholders\n");
}

void test_missing_asset_stops_before_encoding() {
    Workspace ws;
    ScratchLayout layout(ws.settings.paths.scratchRoot, "job1");
    QFile::remove(layout.bodyAudio(LayoutMode::FlatComments, 1));

    FixedProbe probe;
    RecordingEncoder encoder;
    VideoAssembler assembler(ws.settings, &probe, &encoder);
    assert(!assembler.assemble(ws.request()));
    assert(assembler.error() == RenderError::MissingAsset);
    assert(encoder.calls.empty());
    printf("PASS: test_missing_asset_stops_before_encoding\n");
}

void test_title_card_from_template() {
    Workspace ws;
    ws.settings.background.audioVolume = 0.0;
    ScratchLayout layout(ws.settings.paths.scratchRoot, "job1");
    QFile::remove(layout.titleImage());

    QImage templ(400, 200, QImage::Format_ARGB32);
    templ.fill(Qt::white);
    ws.settings.title.templatePath = ws.root.filePath("title_template.png");
    assert(templ.save(ws.settings.title.templatePath));

    FixedProbe probe;
    RecordingEncoder encoder;
    VideoAssembler assembler(ws.settings, &probe, &encoder);
    assembler.setPollInterval(20);
    assert(assembler.assemble(ws.request()));

    QImage card(layout.titleImage());
    assert(!card.isNull());
    assert(card.width() == 400);
    printf("PASS: test_title_card_from_template\n");
}

void test_thumbnail_failure_is_not_fatal() {
    Workspace ws;
    ws.settings.background.audioVolume = 0.0;
    ws.settings.thumbnail.enabled = true;
    ws.settings.thumbnail.backgroundsDir = ws.root.filePath("no-backgrounds");

    FixedProbe probe;
    RecordingEncoder encoder;
    VideoAssembler assembler(ws.settings, &probe, &encoder);
    assembler.setPollInterval(20);
    assert(assembler.assemble(ws.request()));
    assert(assembler.thumbnailPath().isEmpty());
    assert(encoder.calls.size() == 1);
    printf("PASS: test_thumbnail_failure_is_not_fatal\n");
}

void test_credit_is_drawn() {
    Workspace ws;
    ws.settings.background.audioVolume = 0.0;
    ws.settings.background.credit = "bbswitzer";
    ws.settings.background.creditFontPath = ws.root.filePath("fonts/Roboto-Regular.ttf");
    touch(ws.settings.background.creditFontPath);

    FixedProbe probe;
    RecordingEncoder encoder;
    VideoAssembler assembler(ws.settings, &probe, &encoder);
    assembler.setPollInterval(20);
    assert(assembler.assemble(ws.request()));

    const QStringList& args = encoder.calls.front();
    const QString filter = args[args.indexOf("-filter_complex") + 1];
    assert(filter.contains("drawtext=text=Background by bbswitzer"));
    printf("PASS: test_credit_is_drawn\n");
}

static QString writeContent(const QTemporaryDir& dir, const QByteArray& json) {
    const QString path = dir.filePath("content.json");
    QFile file(path);
    bool opened = file.open(QIODevice::WriteOnly);
    assert(opened);
    file.write(json);
    return path;
}

void test_content_descriptor_fills_request() {
    QTemporaryDir dir;
    const QString path = writeContent(dir,
        R"({"thread_id": "job1", "thread_title": "Best 9/10 meal?", "clip_count": 4})");

    AssemblyRequest request;
    QString error;
    assert(ContentDescriptor::load(path, "job1", request, error));
    assert(request.title == "Best 9/10 meal?");
    assert(request.itemCount == 4);
    printf("PASS: test_content_descriptor_fills_request\n");
}

void test_content_descriptor_rejects_other_job() {
    QTemporaryDir dir;
    const QString path = writeContent(dir,
        R"({"thread_id": "job2", "thread_title": "Other", "clip_count": 3})");

    AssemblyRequest request;
    request.title = "unchanged";
    QString error;
    assert(!ContentDescriptor::load(path, "job1", request, error));
    assert(error.contains("job2"));
    assert(request.title == "unchanged");
    printf("PASS: test_content_descriptor_rejects_other_job\n");
}

void test_content_descriptor_without_id() {
    QTemporaryDir dir;
    const QString path = writeContent(dir, R"({"thread_title": "No id", "clip_count": 1})");

    AssemblyRequest request;
    QString error;
    assert(ContentDescriptor::load(path, "job1", request, error));
    assert(request.itemCount == 1);

    assert(!ContentDescriptor::load(dir.filePath("missing.json"), "job1", request, error));
    assert(!error.isEmpty());
    printf("PASS: test_content_descriptor_without_id\n");
}

int main(int argc, char* argv[]) {
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);

    test_silent_background_skips_audio_only();
    test_audio_only_variant_renders_second();
    test_main_failure_skips_audio_only();
    test_blank_mode_writes_placeholders();
    test_missing_asset_stops_before_encoding();
    test_title_card_from_template();
    test_thumbnail_failure_is_not_fatal();
    test_credit_is_drawn();
    test_content_descriptor_fills_request();
    test_content_descriptor_rejects_other_job();
    test_content_descriptor_without_id();
    printf("All video assembler tests passed.\n");
    return 0;
}
