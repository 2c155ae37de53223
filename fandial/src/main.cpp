// c++ headers ------------------------------------------
#include <cstring>

#include <optional>
#include <vector>

// external headers -------------------------------------
#include "raylib.h"
#include "raylib-cpp.hpp"

#if defined(PLATFORM_WEB)
# include <emscripten/emscripten.h>
#endif

#include "imgui.h"
#include "imgui_impl_raylib.h"

// project headers --------------------------------------
#include "mbase/log.h"

#include "asset.h"
#include "text.h"
#include "dial_config.h"
#include "dial_view.h"
#include "raylib_surface.h"

#if defined(_MSC_VER)
# pragma execution_character_set("utf-8")
#endif

//----------------------------------------------------------------------------------
// Global Variables Definition
//----------------------------------------------------------------------------------
constexpr int kScreenWidth = 800;
constexpr int kScreenHeight = 800;

constexpr char const* kDialConfigAsset = "dial_view.cfg";
constexpr char const* kFontAsset = "mplus_fonts/Mplus1-Regular.ttf";

//----------------------------------------------------------------------------------
// Module Functions Declaration
//----------------------------------------------------------------------------------
void InitializeApp(ImFont* im_font);
void ShutdownApp();
void UpdateDrawFrame();

namespace {

/// Japanese glyphs for the overlay, if the font asset is present. Falls back to ImGui's default font.
ImFont* LoadOverlayFont() {
  std::optional<std::vector<std::byte>> opt_bytes = IAssetManager::Get()->LoadAsset(kFontAsset);
  if (!opt_bytes.has_value()) {
    MBASE_LOG_WARN("Font '{}' not found; using the default ImGui font.", kFontAsset);
    return nullptr;
  }

  // ImGui takes ownership of the font data.
  void* bytes = ImGui::MemAlloc(opt_bytes->size());
  memcpy(bytes, opt_bytes->data(), opt_bytes->size());

  ImGuiIO& io = ImGui::GetIO();
  return io.Fonts->AddFontFromMemoryTTF(
    bytes, int(opt_bytes->size()), 20.0f,
    nullptr,
    io.Fonts->GetGlyphRangesJapanese()
  );
}

} // namespace

//----------------------------------------------------------------------------------
// Main Entry Point
//----------------------------------------------------------------------------------
int main() {
  // Initialization
  //--------------------------------------------------------------------------------
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
  raylib::Window window(kScreenWidth, kScreenHeight, "fandial");

  SetTargetFPS(60);

  ImGui::CreateContext();
  {
    ImGuiIO& io = ImGui::GetIO();
    io.BackendFlags |= ImGuiBackendFlags_HasMouseCursors | ImGuiBackendFlags_RendererHasTextures;
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;     // Enable Keyboard Controls
  }
  if (!ImGui_ImplRaylib_Init()) {
    MBASE_LOG_ERROR("Failed to initialize the ImGui raylib backend.");
    ImGui::DestroyContext();
    return 1;
  }

  ImGui::StyleColorsLight();

  SetCurrentLanguage(GetSystemLanguageOrEnglish());

  InitializeApp(LoadOverlayFont());

#if defined(PLATFORM_WEB)
  emscripten_set_main_loop(UpdateDrawFrame, 0, true);
#else

  //--------------------------------------------------------------------------------

  // Mainloop
  while (!WindowShouldClose()) {
    UpdateDrawFrame();
  }
#endif

  // De-Initialization
  //--------------------------------------------------------------------------------
  ShutdownApp();

  ImGui_ImplRaylib_Shutdown();
  ImGui::DestroyContext();

  //--------------------------------------------------------------------------------

  return 0;
}

//----------------------------------------------------------------------------------
// Module Functions Definition
//----------------------------------------------------------------------------------

/// Hosts a single dial filling the window.
///
/// The dial is painted into `dial_texture_` only after it asks for a repaint or the
/// window is resized; every frame just blits the cached texture.
class State final {
public:
  void InitializeApp(ImFont* im_font) {
    im_font_ = im_font;

    fandial::DialConfig const config = fandial::LoadDialConfig(*IAssetManager::Get(), kDialConfigAsset);
    dial_.emplace(config, [this]() { needs_repaint_ = true; });

    ResizeDial(GetScreenWidth(), GetScreenHeight());

    MBASE_LOG_INFO("Dial ready: {}", dial_->GetContentDescription());
  }

  void Shutdown() {
    // Release the texture while the GL context still exists.
    dial_texture_ = raylib::RenderTexture();
    dial_.reset();
  }

  void Tick() {
    ImGui_ImplRaylib_ProcessEvents();

    ImGui_ImplRaylib_NewFrame();
    ImGui::NewFrame();

    if (IsWindowResized()) {
      ResizeDial(GetScreenWidth(), GetScreenHeight());
    }

    ImGuiIO& io = ImGui::GetIO();

    // A click the overlay consumed never reaches the dial's own handling.
    if (raylib::Mouse::IsButtonReleased(MOUSE_BUTTON_LEFT)) {
      raylib::Vector2 const local = raylib::Vector2(raylib::Mouse::GetPosition()) - raylib::Vector2(dial_bounds_.x, dial_bounds_.y);
      if (dial_->HitTest(local)) {
        dial_->Activate(io.WantCaptureMouse);
      }
    }

    if (!io.WantCaptureKeyboard && (IsKeyPressed(KEY_SPACE) || IsKeyPressed(KEY_ENTER))) {
      dial_->Activate();
    }
  }

  void Draw() {
    if (needs_repaint_) {
      RepaintDial();
    }

    BeginDrawing();

    ClearBackground(RAYWHITE);

    // Render textures are stored bottom-up.
    Rectangle const source { 0.0f, 0.0f, dial_bounds_.width, -dial_bounds_.height };
    DrawTextureRec(dial_texture_.texture, source, raylib::Vector2(dial_bounds_.x, dial_bounds_.y), WHITE);

    {
      if (im_font_ != nullptr) ImGui::PushFont(im_font_);

      DrawAccessibilityPanel();

      if (im_font_ != nullptr) ImGui::PopFont();
    }

    ImGui::Render();
    ImGui_ImplRaylib_RenderDrawData(ImGui::GetDrawData());

    EndDrawing();
  }

private:
  void ResizeDial(int width, int height) {
    dial_bounds_ = Rectangle { 0.0f, 0.0f, float(width), float(height) };
    dial_->Resize(dial_bounds_.width, dial_bounds_.height);

    dial_texture_ = raylib::RenderTexture(width, height);
    needs_repaint_ = true;
  }

  void RepaintDial() {
    BeginTextureMode(dial_texture_);
    ClearBackground(BLANK);

    fandial::RaylibSurface surface(Rectangle { 0.0f, 0.0f, dial_bounds_.width, dial_bounds_.height });
    dial_->Render(surface);

    EndTextureMode();

    needs_repaint_ = false;
  }

  /// Shows what a screen reader would announce, and the UI language.
  void DrawAccessibilityPanel() {
    ImGuiWindowFlags window_flags =
      ImGuiWindowFlags_NoDecoration |
      ImGuiWindowFlags_AlwaysAutoResize |
      ImGuiWindowFlags_NoSavedSettings |
      ImGuiWindowFlags_NoFocusOnAppearing |
      ImGuiWindowFlags_NoNav |
      ImGuiWindowFlags_NoMove;

    constexpr float kPadding = 10.0f;
    ImGuiIO& io = ImGui::GetIO();
    ImGui::SetNextWindowPos(ImVec2(kPadding, io.DisplaySize.y - kPadding), ImGuiCond_Always, ImVec2(0.0f, 1.0f));
    ImGui::SetNextWindowBgAlpha(0.85f);

    if (ImGui::Begin("##accessibility", nullptr, window_flags)) {
      ImGui::TextColored(ImVec4(0.2f, 0.4f, 0.7f, 1.0f), "%s", GetText(TextId::kFanControl));

      fandial::AccessibilityInfo const& info = dial_->GetAccessibilityInfo();
      ImGui::Text("%s: %s", GetText(TextId::kNarration), info.description.c_str());
      ImGui::Text("%s: %s", GetText(TextId::kActionLabel), info.action_label.c_str());

      ImGui::Separator();

      Language const current_lang = GetCurrentLanguage();
      if (ImGui::RadioButton("Deutsch", current_lang == Language::kGerman)) {
        ChangeLanguage(Language::kGerman);
      }
      ImGui::SameLine();
      if (ImGui::RadioButton("English", current_lang == Language::kEnglish)) {
        ChangeLanguage(Language::kEnglish);
      }
      ImGui::SameLine();
      if (ImGui::RadioButton("日本語", current_lang == Language::kJapanese)) {
        ChangeLanguage(Language::kJapanese);
      }
    }
    ImGui::End();
  }

  void ChangeLanguage(Language lang) {
    if (lang == GetCurrentLanguage()) return;
    SetCurrentLanguage(lang);
    dial_->RefreshText();
  }

  ImFont* im_font_ = nullptr;

  std::optional<fandial::DialView> dial_;
  Rectangle dial_bounds_ { 0.0f, 0.0f, 0.0f, 0.0f };

  raylib::RenderTexture dial_texture_;
  bool needs_repaint_ = true;
};
static State s_state;

void InitializeApp(ImFont* im_font) {
  s_state.InitializeApp(im_font);
}

void ShutdownApp() {
  s_state.Shutdown();
}

void UpdateDrawFrame(void) {
  s_state.Tick();

  s_state.Draw();
}
