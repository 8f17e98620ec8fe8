#pragma once

#include <QString>

struct AssemblyRequest;

// content.json written by the upstream collection step for one job
namespace ContentDescriptor {

// Fills title and itemCount from thread_title and clip_count. A thread_id
// that is present must match expectedId, the job id the caller was given.
bool load(const QString& path, const QString& expectedId, AssemblyRequest& request, QString& error);

} // namespace ContentDescriptor
