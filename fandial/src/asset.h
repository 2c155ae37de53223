#pragma once

// c++ headers ------------------------------------------
#include <cstddef>

#include <optional>
#include <vector>

// project headers --------------------------------------
#include "mbase/access.h"

class IAssetManager {
public:
  virtual ~IAssetManager() = default;
  MBASE_DEFAULT_COPY_DISALLOW_MOVE(IAssetManager);

  static IAssetManager* Get();

  /// Read a whole asset. `asset_path` is relative to the asset root: `$FANDIAL_ASSET_DIR`
  /// if set, otherwise "assets" in the working directory.
  virtual std::optional<std::vector<std::byte>> LoadAsset(char const* asset_path) = 0;

protected:
  IAssetManager() = default;
};
