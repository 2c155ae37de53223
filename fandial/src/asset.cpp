// TU header --------------------------------------------
#include "asset.h"

// c++ headers ------------------------------------------
#include <cstdlib>
#include <cstring>

#include <memory>
#include <mutex>
#include <atomic>
#include <filesystem>

// project headers --------------------------------------
#include "mbase/platform.h"
#include "mbase/log.h"

// conditional c++ headers ------------------------------
#if MBASE_PLATFORM_DESKTOP
# include <fstream>
#endif

// conditional external headers -------------------------
#if MBASE_PLATFORM_WEB
# include <emscripten/fetch.h>
# include <emscripten/emscripten.h> // emscripten_sleep
#endif

namespace {

std::filesystem::path ResolveAssetPath(char const* asset_path) {
#if MBASE_PLATFORM_DESKTOP
  // Assume that the current working directory has the "assets" directory, unless overridden.
  char const* root_override = std::getenv("FANDIAL_ASSET_DIR");
  std::filesystem::path const root_path = (root_override != nullptr && root_override[0] != '\0')
    ? std::filesystem::path(root_override)
    : std::filesystem::path("assets");
  return root_path / asset_path;
#elif MBASE_PLATFORM_WEB
  // Assume that the "assets" directory is served at the same level as the HTML file.
  static std::filesystem::path const kRootPath = "/fandial/assets"; // Root-relative path in the web server.
  return kRootPath / asset_path;
#else
  return std::filesystem::path(asset_path);
#endif
}

std::mutex s_ptr_mutex;
std::unique_ptr<IAssetManager> s_asset_manager;

}

class AssetManager final : public IAssetManager {
public:
  [[nodiscard]] AssetManager() = default;
  ~AssetManager() override = default;
  MBASE_DISALLOW_COPY_MOVE(AssetManager);

  //
  // IAssetManager implementation
  //

  std::optional<std::vector<std::byte>> LoadAsset(char const* asset_path) override {
    std::filesystem::path const resolved_path = ResolveAssetPath(asset_path);

#if MBASE_PLATFORM_DESKTOP
    std::ifstream file(resolved_path, std::ios::in | std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
      MBASE_LOG_WARN("Failed to open asset: {}", resolved_path.string());
      return std::nullopt;
    }

    std::streampos const size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::byte> file_buffer;
    file_buffer.resize(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(file_buffer.data()), size)) {
      MBASE_LOG_ERROR("Failed to read asset: {}", resolved_path.string());
      return std::nullopt;
    }

    return file_buffer;
#elif MBASE_PLATFORM_WEB
    struct FetchContext {
      std::atomic<bool> done{false};
      std::atomic<bool> success{false};
      std::vector<std::byte> data;
    };

    FetchContext ctx;

    emscripten_fetch_attr_t attr;
    emscripten_fetch_attr_init(&attr);
    strcpy(attr.requestMethod, "GET");
    attr.attributes = EMSCRIPTEN_FETCH_LOAD_TO_MEMORY;
    attr.userData = &ctx;

    attr.onsuccess = [](emscripten_fetch_t* fetch) {
      FetchContext* ctx = static_cast<FetchContext*>(fetch->userData);
      ctx->data.resize(fetch->numBytes);
      memcpy(ctx->data.data(), fetch->data, fetch->numBytes);
      ctx->success = true;
      ctx->done = true;
      emscripten_fetch_close(fetch);
    };

    attr.onerror = [](emscripten_fetch_t* fetch) {
      FetchContext* ctx = static_cast<FetchContext*>(fetch->userData);
      MBASE_LOG_WARN("Fetch failed: {}, HTTP status {}", fetch->url, fetch->status);
      ctx->success = false;
      ctx->done = true;
      emscripten_fetch_close(fetch);
    };

    emscripten_fetch(&attr, resolved_path.c_str());

    // Wait for completion using ASYNCIFY
    while (!ctx.done) {
      emscripten_sleep(10);
    }

    if (!ctx.success) {
      return std::nullopt;
    }

    return std::move(ctx.data);
#else
    MBASE_LOG_ERROR("AssetManager::LoadAsset: Not implemented for this platform.");
    return std::nullopt;
#endif
  }
};

IAssetManager* IAssetManager::Get() {
  std::lock_guard lock(s_ptr_mutex);
  if (s_asset_manager == nullptr) {
    s_asset_manager = std::make_unique<AssetManager>();
  }
  return s_asset_manager.get();
}
