// TU header --------------------------------------------
#include "text.h"

// c++ headers ------------------------------------------
#include <cstdint>

#include <array>
#include <unordered_map>

// platform detection -----------------------------------
#include "mbase/platform.h"

// conditional c++ headers ------------------------------
#if MBASE_PLATFORM_LINUX
# include <cstdlib>
#endif

#if MBASE_PLATFORM_LINUX || MBASE_PLATFORM_WEB
# include <cstring>
#endif

// conditional platform headers -------------------------
#if MBASE_PLATFORM_WINDOWS
# include <Windows.h>
#elif MBASE_PLATFORM_WEB
# include <emscripten/emscripten.h>
#endif

#if defined(_MSC_VER)
# pragma execution_character_set("utf-8")
#endif

constexpr uint32_t kLanguageCount = 3;

namespace {

#define MAKE_TEXT(id, de, en, jp) std::make_pair(TextId::id, std::array<const char*, kLanguageCount>{{ de, en, jp }})

// Speed labels are drawn around the dial with raylib's default font, so they stay short and ASCII.
std::unordered_map<TextId, std::array<const char*, kLanguageCount>> const kTextMap = {
  MAKE_TEXT(kFanOff,      "aus",         "off",         "OFF"),
  MAKE_TEXT(kFanLow,      "1",           "1",           "1"),
  MAKE_TEXT(kFanMedium,   "2",           "2",           "2"),
  MAKE_TEXT(kFanHigh,     "3",           "3",           "3"),
  MAKE_TEXT(kChange,      "ändern",      "change",      "変更"),
  MAKE_TEXT(kReset,       "zurücksetzen", "reset",      "リセット"),
  MAKE_TEXT(kFanControl,  "Lüftersteuerung", "Fan Control", "ファン制御"),
  MAKE_TEXT(kNarration,   "Beschreibung", "Description", "説明"),
  MAKE_TEXT(kActionLabel, "Aktion",      "Action",      "アクション"),
};

#undef MAKE_TEXT

Language current_language = Language::kEnglish;

} // namespace

Language GetSystemLanguageOrEnglish() {
  Language language = Language::kEnglish;

#if MBASE_PLATFORM_WINDOWS
  {
    // On Windows, use the system locale.
    wchar_t locale_name[LOCALE_NAME_MAX_LENGTH] = { 0 };
    if (GetUserDefaultLocaleName(locale_name, LOCALE_NAME_MAX_LENGTH) > 0) {
      if (wcsncmp(locale_name, L"de", 2) == 0) {
        language = Language::kGerman;
      }
      else if (wcsncmp(locale_name, L"ja", 2) == 0) {
        language = Language::kJapanese;
      }
    }
  }
#elif MBASE_PLATFORM_LINUX || MBASE_PLATFORM_WEB
  {
# if MBASE_PLATFORM_LINUX
    char const* locale = std::getenv("LANGUAGE");
# elif MBASE_PLATFORM_WEB
    char const* locale = emscripten_run_script_string("window.navigator.language");
# endif
    if (locale != nullptr) {
      if (strncmp(locale, "de", 2) == 0) {
        language = Language::kGerman;
      }
      else if (strncmp(locale, "ja", 2) == 0) {
        language = Language::kJapanese;
      }
    }
  }
#endif

  return language;
}

Language GetCurrentLanguage() {
  return current_language;
}

void SetCurrentLanguage(Language lang) {
  current_language = lang;
}

const char* GetText(TextId id) {
  return GetTextInLang(id, current_language);
}

const char* GetTextInLang(TextId id, Language lang) {
  auto it = kTextMap.find(id);
  if (it == kTextMap.end()) {
    return "???";
  }
  uint32_t lang_index = static_cast<uint32_t>(lang);
  if (lang_index >= kLanguageCount) {
    lang_index = 1; // default to English
  }
  return it->second[lang_index];
}
