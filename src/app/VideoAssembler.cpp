#include "VideoAssembler.h"
#include "AssetGatherer.h"
#include "CompositionGraphBuilder.h"
#include "ImageUtil.h"
#include "Logging.h"
#include "NameUtil.h"
#include "Renderer.h"
#include "TextComposer.h"
#include "ThumbnailComposer.h"
#include "TimeUtil.h"
#include "TimelineBuilder.h"
#include <QDir>
#include <QFileInfo>
#include <QImage>

VideoAssembler::VideoAssembler(const RenderSettings& settings, DurationProbe* probe,
                               EncoderProcess* encoder, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_probe(probe)
    , m_encoder(encoder)
    , m_pollIntervalMs(AppConstants::ProgressPollIntervalMs) {
    qRegisterMetaType<RenderVariant>();
}

VideoAssembler::~VideoAssembler() = default;

QString VideoAssembler::variantName(RenderVariant variant) {
    return variant == RenderVariant::Main ? "main" : "audio-only";
}

bool VideoAssembler::assemble(const AssemblyRequest& request) {
    m_error = RenderError::None;
    m_errorString.clear();
    m_diagnostics.clear();
    m_producedPaths.clear();
    m_thumbnailPath.clear();
    m_videoLength = 0.0;

    if (request.jobId.isEmpty())
        return fail(RenderError::Config, "Empty job id");

    const LayoutMode mode = m_settings.layoutMode;
    ScratchLayout layout(m_settings.paths.scratchRoot, request.jobId);
    qCInfo(lcAssembly).noquote() << "Assembling" << request.jobId
                                 << "mode" << LayoutModes::toString(mode)
                                 << "items" << request.itemCount;

    emit stageStarted("Creating the title card");
    if (!prepareTitleCard(layout, request.title))
        return false;
    if (mode == LayoutMode::StoryPerParagraphBlank && !preparePlaceholders(layout, request.itemCount))
        return false;

    emit stageStarted("Gathering assets");
    AssetGatherer gatherer(layout, m_probe);
    std::vector<MediaSegment> segments;
    if (!gatherer.gather(mode, request.itemCount, segments))
        return fail(gatherer.error(), gatherer.errorString());

    TimelineConfig timelineConfig;
    timelineConfig.mode = mode;
    timelineConfig.opacity = LayoutModes::appliesOpacity(mode) ? m_settings.opacity : 1.0;

    TimelineBuilder timeline(timelineConfig);
    std::vector<OverlayWindow> windows;
    if (!timeline.build(segments, windows))
        return fail(timeline.error(), timeline.errorString());

    m_videoLength = TimelineBuilder::totalDuration(segments);
    qCInfo(lcAssembly).noquote() << "Video will be" << TimeUtil::secondsToMinutesText(m_videoLength)
                                 << "long," << windows.size() << "overlays";

    const QString name = NameUtil::normalizeFileName(request.title);
    if (name.isEmpty())
        return fail(RenderError::Config, "Title yields an empty output name");

    const bool audioOnly = m_settings.rendersAudioOnlyVariant();
    ResultLayout results(m_settings.paths.resultsRoot, m_settings.paths.category);
    if (!results.ensureFolders(audioOnly, m_settings.thumbnail.enabled))
        return fail(RenderError::Config, results.errorString());

    if (m_settings.thumbnail.enabled) {
        emit stageStarted("Creating the thumbnail");
        prepareThumbnail(results, request.title, name);
    }

    RenderJob job;
    job.backgroundVideoPath = layout.backgroundVideo();
    job.backgroundAudioPath = layout.backgroundAudio();
    job.segments = segments;
    job.mode = mode;
    job.width = m_settings.resolution.width();
    job.height = m_settings.resolution.height();
    job.opacity = m_settings.opacity;
    job.backgroundAudioVolume = m_settings.background.audioVolume;
    if (!m_settings.background.credit.isEmpty())
        job.creditText = QString("Background by %1").arg(m_settings.background.credit);
    job.creditFontPath = m_settings.background.creditFontPath;
    job.creditFontSize = m_settings.background.creditFontSize;
    job.creditFontColor = m_settings.background.creditFontColor;
    job.mainOutputPath = results.mainVideo(name);
    if (audioOnly)
        job.audioOnlyOutputPath = results.audioOnlyVideo(name);

    emit stageStarted("Rendering the video");
    if (!renderVariant(RenderVariant::Main, job, windows, job.mainOutputPath))
        return false;

    if (job.wantsAudioOnlyVariant()) {
        emit stageStarted("Rendering the narration-only video");
        if (!renderVariant(RenderVariant::AudioOnly, job, windows, job.audioOnlyOutputPath))
            return false;
    }

    qCInfo(lcAssembly).noquote() << "Done," << m_producedPaths.size() << "video(s) written";
    return true;
}

bool VideoAssembler::prepareTitleCard(const ScratchLayout& layout, const QString& title) {
    const QString target = layout.titleImage();
    QImage templateImage(m_settings.title.templatePath);
    if (templateImage.isNull()) {
        if (QFileInfo::exists(target)) {
            qCWarning(lcAssembly).noquote() << "Title template" << m_settings.title.templatePath
                                            << "not readable, keeping" << target;
            return true;
        }
        return fail(RenderError::Compose,
                    QString("Cannot read title template: %1").arg(m_settings.title.templatePath));
    }

    TextStyle style;
    style.fontPath = m_settings.title.fontPath;
    style.pixelSize = m_settings.title.fontSize;
    style.color = ImageUtil::parseColor(m_settings.title.color, Qt::black);
    style.padding = m_settings.title.padding;
    style.wrapWidth = m_settings.title.wrap;

    TextComposer composer;
    QImage card = composer.composeTitleCard(templateImage, NameUtil::normalizeTitle(title), style,
                                            m_settings.title.channelName);
    if (card.isNull())
        return fail(RenderError::Compose, composer.errorString());

    if (!QDir().mkpath(layout.imageDir()))
        return fail(RenderError::Compose, QString("Cannot create %1").arg(layout.imageDir()));
    if (!card.save(target, "PNG"))
        return fail(RenderError::Compose, QString("Cannot write title card: %1").arg(target));

    qCDebug(lcAssembly).noquote() << "Title card written to" << target;
    return true;
}

bool VideoAssembler::preparePlaceholders(const ScratchLayout& layout, int itemCount) {
    const int side = CompositionGraphBuilder::overlayWidth(m_settings.resolution.width());
    if (!QDir().mkpath(layout.imageDir()))
        return fail(RenderError::Compose, QString("Cannot create %1").arg(layout.imageDir()));

    for (int i = 0; i < itemCount; ++i) {
        QString error;
        const QString path = layout.bodyImage(LayoutMode::StoryPerParagraphBlank, i);
        if (!ImageUtil::writeTransparentPlaceholder(path, side, side, &error))
            return fail(RenderError::Compose, error);
    }
    return true;
}

void VideoAssembler::prepareThumbnail(ResultLayout& results, const QString& title,
                                      const QString& name) {
    ThumbnailStyle style;
    style.fontFamily = m_settings.thumbnail.fontFamily;
    style.fontSize = m_settings.thumbnail.fontSize;
    style.color = ImageUtil::parseColor(m_settings.thumbnail.fontColor, Qt::white);

    TextComposer textComposer;
    ThumbnailComposer composer(&textComposer);
    const QString path = results.thumbnail(name);
    if (!composer.composeToFile(m_settings.thumbnail.backgroundsDir, title, style, path)) {
        qCWarning(lcAssembly).noquote() << "Thumbnail skipped:" << composer.errorString();
        return;
    }
    m_thumbnailPath = path;
}

bool VideoAssembler::renderVariant(RenderVariant variant, const RenderJob& job,
                                   const std::vector<OverlayWindow>& windows,
                                   const QString& outputPath) {
    const AudioVariant audio = variant == RenderVariant::Main
        ? AudioVariant::Mixed : AudioVariant::NarrationOnly;

    CompositionGraphBuilder builder;
    CompositionGraph graph;
    if (!builder.build(job, windows, audio, graph))
        return fail(builder.error(), builder.errorString());

    Renderer renderer(m_encoder, m_settings.encoder);
    renderer.setPollInterval(m_pollIntervalMs);
    const bool ok = renderer.render(graph, outputPath, m_videoLength,
                                    [this, variant](double fraction) {
                                        emit progress(variant, fraction);
                                    });
    if (!ok) {
        m_diagnostics = renderer.diagnostics();
        return fail(renderer.error(), renderer.errorString());
    }

    qCInfo(lcAssembly).noquote() << "Rendered" << variantName(variant) << "video:"
                                 << renderer.producedPath();
    m_producedPaths << renderer.producedPath();
    return true;
}

bool VideoAssembler::fail(RenderError error, const QString& message) {
    m_error = error;
    m_errorString = message;
    qCCritical(lcAssembly).noquote() << renderErrorName(error) << message;
    return false;
}
