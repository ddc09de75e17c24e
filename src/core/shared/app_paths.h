#pragma once

#include <QString>

namespace gt {

// On-disk locations. Each honours an environment override so tests and
// sandboxes can redirect state:
//   GOTO_CONFIG_DIR  config.json, tech_signatures.json, tests.json
//   GOTO_DATA_DIR    cache.db and the writable model cache
//   GOTO_MODELS_DIR  an existing models directory (read-only use)
QString configDirectory();
QString dataDirectory();
QString databasePath();
QString writableModelsDirectory();

} // namespace gt
