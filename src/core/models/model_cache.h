#pragma once

#include <QString>

namespace gt {

// Where the embedder's manifest and artifacts live.
//
// $GOTO_MODELS_DIR wins when set. Otherwise the writable cache under the
// data directory is used, seeded on first use from the manifest shipped
// with the binary (Qt resource, install prefix or source tree).
QString resolveModelsDir();

QString writableModelsDir();

// Copies the shipped manifest.json (and vocab.txt, when shipped) into the
// writable cache unless a manifest is already there.
bool seedModelCache(const QString& cacheDir, QString* errorOut = nullptr);

} // namespace gt
