#include "ContentDescriptor.h"
#include "VideoAssembler.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

namespace ContentDescriptor {

bool load(const QString& path, const QString& expectedId, AssemblyRequest& request, QString& error) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error = QString("Cannot read content descriptor: %1").arg(path);
        return false;
    }
    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        error = QString("Invalid content descriptor %1: %2").arg(path, parseError.errorString());
        return false;
    }
    auto obj = doc.object();

    if (obj.contains("thread_id")) {
        const QString id = obj["thread_id"].toVariant().toString();
        if (id != expectedId) {
            error = QString("Content descriptor %1 belongs to %2, not %3").arg(path, id, expectedId);
            return false;
        }
    }

    request.title = obj["thread_title"].toString();
    request.itemCount = obj["clip_count"].toInt();
    return true;
}

} // namespace ContentDescriptor
