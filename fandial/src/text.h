#pragma once

enum class Language {
  kGerman,
  kEnglish,
  kJapanese,
};

enum class TextId {
  kFanOff,
  kFanLow,
  kFanMedium,
  kFanHigh,
  kChange,
  kReset,
  kFanControl,
  kNarration,
  kActionLabel,
};

Language GetSystemLanguageOrEnglish();

Language GetCurrentLanguage();
void SetCurrentLanguage(Language lang);

const char* GetText(TextId id);

const char* GetTextInLang(TextId id, Language lang);
