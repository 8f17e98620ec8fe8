#include <cassert>
#include <cstdio>
#include <cmath>
#include <vector>
#include <QCoreApplication>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QThread>
#include "render/EncoderProcess.h"
#include "render/Renderer.h"

// Records each invocation; optionally writes progress samples while "encoding"
class FakeEncoder : public EncoderProcess {
public:
    EncodeResult result;
    std::vector<QStringList> calls;
    QByteArray progressText;

    EncodeResult execute(const QStringList& arguments) override {
        calls.push_back(arguments);
        if (!progressText.isEmpty()) {
            const int at = arguments.indexOf("-progress");
            QFile channel(arguments.value(at + 1));
            if (channel.open(QIODevice::WriteOnly | QIODevice::Append)) {
                channel.write(progressText);
                channel.close();
            }
            QThread::msleep(150);
        }
        return result;
    }
};

struct Progress {
    QMutex mutex;
    std::vector<double> values;

    ProgressCallback callback() {
        return [this](double f) {
            QMutexLocker lock(&mutex);
            values.push_back(f);
        };
    }
};

static CompositionGraph sampleGraph() {
    CompositionGraph graph;
    NodeId bg = graph.addInput("background.mp4", StreamType::Video);
    NodeId scaled = graph.addFilter(NodeKind::Scale, StreamType::Video, {bg}, {{"", "1080"}, {"", "1920"}});
    NodeId voice = graph.addInput("title.mp3", StreamType::Audio);
    NodeId audio = graph.addFilter(NodeKind::ConcatAudio, StreamType::Audio, {voice},
                                   {{"n", "1"}, {"v", "0"}, {"a", "1"}});
    graph.addOutput(scaled, audio);
    return graph;
}

void test_encoder_failure_reports_encode_error() {
    FakeEncoder encoder;
    encoder.result.started = true;
    encoder.result.exitCode = 1;
    encoder.result.diagnostics = "Invalid data found when processing input";

    Progress progress;
    Renderer renderer(&encoder, EncoderSettings());
    renderer.setPollInterval(20);
    assert(!renderer.render(sampleGraph(), "out/video.mp4", 8.0, progress.callback()));
    assert(renderer.error() == RenderError::Encode);
    assert(renderer.producedPath().isEmpty());
    assert(renderer.diagnostics().contains("Invalid data"));
    assert(encoder.calls.size() == 1);
    for (double v : progress.values) {
        assert(v < 1.0);
    }
    printf("PASS: test_encoder_failure_reports_encode_error\n");
}

void test_success_pins_final_progress() {
    FakeEncoder encoder;
    encoder.result.started = true;
    encoder.result.exitCode = 0;
    encoder.progressText = "out_time_ms=4000000\nprogress=continue\n";

    Progress progress;
    Renderer renderer(&encoder, EncoderSettings());
    renderer.setPollInterval(20);
    assert(renderer.render(sampleGraph(), "out/video.mp4", 8.0, progress.callback()));
    assert(renderer.error() == RenderError::None);
    assert(renderer.producedPath() == "out/video.mp4");

    assert(!progress.values.empty());
    assert(std::abs(progress.values.back() - 1.0) < 1e-9);
    for (size_t i = 1; i < progress.values.size(); ++i) {
        assert(progress.values[i] >= progress.values[i - 1]);
    }
    printf("PASS: test_success_pins_final_progress\n");
}

void test_arguments() {
    FakeEncoder encoder;
    EncoderSettings settings;
    settings.threads = 3;
    Renderer renderer(&encoder, settings);

    const QStringList args = renderer.buildArguments(sampleGraph(), "out.mp4", "/tmp/progress.txt");
    assert(args.first() == "-y");
    assert(args.contains("-nostats"));
    assert(args[args.indexOf("-progress") + 1] == "/tmp/progress.txt");
    assert(args[args.indexOf("-filter_complex") + 1] ==
           "[0:v]scale=1080:1920[s1];[1:a]concat=n=1:v=0:a=1[s3]");
    assert(args[args.indexOf("-c:v") + 1] == "h264");
    assert(args[args.indexOf("-b:v") + 1] == "20M");
    assert(args[args.indexOf("-b:a") + 1] == "192k");
    assert(args[args.indexOf("-f") + 1] == "mp4");
    assert(args[args.indexOf("-threads") + 1] == "3");
    assert(args.last() == "out.mp4");
    assert(args.indexOf("-i") < args.indexOf("-filter_complex"));
    assert(args.indexOf("-filter_complex") < args.indexOf("-map"));
    printf("PASS: test_arguments\n");
}

void test_invalid_graph_is_not_encoded() {
    FakeEncoder encoder;
    Renderer renderer(&encoder, EncoderSettings());
    CompositionGraph empty;
    assert(!renderer.render(empty, "out.mp4", 1.0, nullptr));
    assert(renderer.error() == RenderError::GraphBuild);
    assert(encoder.calls.empty());
    printf("PASS: test_invalid_graph_is_not_encoded\n");
}

void test_real_process_failures() {
    // "false" starts and exits with status 1
    FfmpegProcess failing("false");
    Renderer renderer(&failing, EncoderSettings());
    renderer.setPollInterval(20);
    assert(!renderer.render(sampleGraph(), "never.mp4", 1.0, nullptr));
    assert(renderer.error() == RenderError::Encode);
    assert(renderer.producedPath().isEmpty());

    FfmpegProcess missing("reelforge-no-such-encoder");
    EncodeResult result = missing.execute({"-version"});
    assert(!result.started);
    assert(!result.succeeded());
    assert(!result.diagnostics.isEmpty());
    printf("PASS: test_real_process_failures\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    test_encoder_failure_reports_encode_error();
    test_success_pins_final_progress();
    test_arguments();
    test_invalid_graph_is_not_encoded();
    test_real_process_failures();
    printf("All renderer tests passed.\n");
    return 0;
}
