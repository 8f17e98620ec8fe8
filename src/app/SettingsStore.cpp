#include "SettingsStore.h"
#include <QFile>
#include <QJsonDocument>

SettingsStore::SettingsStore(QObject* parent) : QObject(parent) {}
SettingsStore::~SettingsStore() = default;

bool SettingsStore::save(const QString& filePath, const RenderSettings& settings) {
    m_error = RenderError::None;
    m_errorString.clear();

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(QString("Cannot write to: %1").arg(filePath));
    }

    file.write(QJsonDocument(settingsToJson(settings)).toJson(QJsonDocument::Indented));
    return true;
}

bool SettingsStore::load(const QString& filePath, RenderSettings& settings) {
    m_error = RenderError::None;
    m_errorString.clear();

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(QString("Cannot read: %1").arg(filePath));
    }

    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        return fail(QString("Invalid settings format: %1").arg(parseError.errorString()));
    }

    auto root = doc.object();
    int version = root["version"].toInt(1);
    if (version != 1) {
        return fail(QString("Unsupported settings version %1").arg(version));
    }

    const QString mode = root["video"].toObject()["layout_mode"].toString("flat_comments");
    LayoutMode parsed;
    if (!LayoutModes::fromString(mode, parsed)) {
        return fail(QString("Unknown layout mode: %1").arg(mode));
    }

    RenderSettings loaded = settingsFromJson(root);
    QString invalid;
    if (!validate(loaded, &invalid)) {
        return fail(invalid);
    }

    settings = loaded;
    return true;
}

QJsonObject SettingsStore::settingsToJson(const RenderSettings& s) {
    QJsonObject video;
    video["width"] = s.resolution.width();
    video["height"] = s.resolution.height();
    video["opacity"] = s.opacity;
    video["layout_mode"] = LayoutModes::toString(s.layoutMode);

    QJsonObject background;
    background["audio_volume"] = s.background.audioVolume;
    background["enable_extra_audio"] = s.background.enableExtraAudio;
    background["credit"] = s.background.credit;
    background["credit_font"] = s.background.creditFontPath;
    background["credit_font_size"] = s.background.creditFontSize;
    background["credit_font_color"] = s.background.creditFontColor;

    QJsonObject title;
    title["template"] = s.title.templatePath;
    title["font"] = s.title.fontPath;
    title["font_size"] = s.title.fontSize;
    title["color"] = s.title.color;
    title["padding"] = s.title.padding;
    title["wrap"] = s.title.wrap;
    title["channel_name"] = s.title.channelName;

    QJsonObject thumbnail;
    thumbnail["enabled"] = s.thumbnail.enabled;
    thumbnail["backgrounds_dir"] = s.thumbnail.backgroundsDir;
    thumbnail["font_family"] = s.thumbnail.fontFamily;
    thumbnail["font_size"] = s.thumbnail.fontSize;
    thumbnail["font_color"] = s.thumbnail.fontColor;

    QJsonObject encoder;
    encoder["program"] = s.encoder.program;
    encoder["video_codec"] = s.encoder.videoCodec;
    encoder["video_bitrate"] = s.encoder.videoBitrate;
    encoder["audio_bitrate"] = s.encoder.audioBitrate;
    encoder["format"] = s.encoder.format;
    encoder["threads"] = s.encoder.threads;

    QJsonObject paths;
    paths["scratch_root"] = s.paths.scratchRoot;
    paths["results_root"] = s.paths.resultsRoot;
    paths["category"] = s.paths.category;

    QJsonObject root;
    root["version"] = 1;
    root["video"] = video;
    root["background"] = background;
    root["title"] = title;
    root["thumbnail"] = thumbnail;
    root["encoder"] = encoder;
    root["paths"] = paths;
    return root;
}

RenderSettings SettingsStore::settingsFromJson(const QJsonObject& obj) {
    RenderSettings s;

    auto video = obj["video"].toObject();
    s.resolution = QSize(video["width"].toInt(s.resolution.width()),
                         video["height"].toInt(s.resolution.height()));
    s.opacity = video["opacity"].toDouble(s.opacity);
    LayoutMode mode;
    if (LayoutModes::fromString(video["layout_mode"].toString(), mode)) {
        s.layoutMode = mode;
    }

    auto background = obj["background"].toObject();
    s.background.audioVolume = background["audio_volume"].toDouble(s.background.audioVolume);
    s.background.enableExtraAudio = background["enable_extra_audio"].toBool(s.background.enableExtraAudio);
    s.background.credit = background["credit"].toString(s.background.credit);
    s.background.creditFontPath = background["credit_font"].toString(s.background.creditFontPath);
    s.background.creditFontSize = background["credit_font_size"].toInt(s.background.creditFontSize);
    s.background.creditFontColor = background["credit_font_color"].toString(s.background.creditFontColor);

    auto title = obj["title"].toObject();
    s.title.templatePath = title["template"].toString(s.title.templatePath);
    s.title.fontPath = title["font"].toString(s.title.fontPath);
    s.title.fontSize = title["font_size"].toInt(s.title.fontSize);
    s.title.color = title["color"].toString(s.title.color);
    s.title.padding = title["padding"].toInt(s.title.padding);
    s.title.wrap = title["wrap"].toInt(s.title.wrap);
    s.title.channelName = title["channel_name"].toString(s.title.channelName);

    auto thumbnail = obj["thumbnail"].toObject();
    s.thumbnail.enabled = thumbnail["enabled"].toBool(s.thumbnail.enabled);
    s.thumbnail.backgroundsDir = thumbnail["backgrounds_dir"].toString(s.thumbnail.backgroundsDir);
    s.thumbnail.fontFamily = thumbnail["font_family"].toString(s.thumbnail.fontFamily);
    s.thumbnail.fontSize = thumbnail["font_size"].toInt(s.thumbnail.fontSize);
    s.thumbnail.fontColor = thumbnail["font_color"].toString(s.thumbnail.fontColor);

    auto encoder = obj["encoder"].toObject();
    s.encoder.program = encoder["program"].toString(s.encoder.program);
    s.encoder.videoCodec = encoder["video_codec"].toString(s.encoder.videoCodec);
    s.encoder.videoBitrate = encoder["video_bitrate"].toString(s.encoder.videoBitrate);
    s.encoder.audioBitrate = encoder["audio_bitrate"].toString(s.encoder.audioBitrate);
    s.encoder.format = encoder["format"].toString(s.encoder.format);
    s.encoder.threads = encoder["threads"].toInt(s.encoder.threads);

    auto paths = obj["paths"].toObject();
    s.paths.scratchRoot = paths["scratch_root"].toString(s.paths.scratchRoot);
    s.paths.resultsRoot = paths["results_root"].toString(s.paths.resultsRoot);
    s.paths.category = paths["category"].toString(s.paths.category);
    return s;
}

bool SettingsStore::validate(const RenderSettings& s, QString* error) {
    auto setError = [error](const QString& msg) {
        if (error) *error = msg;
        return false;
    };

    if (s.resolution.width() <= 0 || s.resolution.height() <= 0)
        return setError(QString("Invalid resolution %1x%2")
                            .arg(s.resolution.width()).arg(s.resolution.height()));
    if (s.opacity < 0.0 || s.opacity > 1.0)
        return setError(QString("Opacity %1 outside [0, 1]").arg(s.opacity));
    if (s.background.audioVolume < 0.0)
        return setError(QString("Negative background audio volume %1").arg(s.background.audioVolume));
    if (s.encoder.program.isEmpty())
        return setError("Encoder program is empty");
    if (s.encoder.threads < 0)
        return setError(QString("Invalid encoder thread count %1").arg(s.encoder.threads));
    if (s.paths.category.isEmpty())
        return setError("Results category is empty");
    return true;
}

bool SettingsStore::fail(const QString& message) {
    m_error = RenderError::Config;
    m_errorString = message;
    return false;
}
