#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>
#include "RenderError.h"
#include "RenderSettings.h"

class SettingsStore : public QObject {
    Q_OBJECT
public:
    explicit SettingsStore(QObject* parent = nullptr);
    ~SettingsStore();

    bool save(const QString& filePath, const RenderSettings& settings);
    bool load(const QString& filePath, RenderSettings& settings);

    static QJsonObject settingsToJson(const RenderSettings& settings);
    static RenderSettings settingsFromJson(const QJsonObject& obj);
    static bool validate(const RenderSettings& settings, QString* error = nullptr);

    RenderError error() const { return m_error; }
    QString errorString() const { return m_errorString; }

private:
    bool fail(const QString& message);

    RenderError m_error = RenderError::None;
    QString m_errorString;
};
