// Copyright 2010-2021, Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
//     * Redistributions of source code must retain the above copyright
// notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above
// copyright notice, this list of conditions and the following disclaimer
// in the documentation and/or other materials provided with the
// distribution.
//     * Neither the name of Google Inc. nor the names of its
// contributors may be used to endorse or promote products derived from
// this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "composer/table.h"

#include <cstddef>
#include <fstream>
#include <istream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "base/vlog.h"

namespace kanabridge {
namespace composer {
namespace {

struct Rule {
  absl::string_view input;
  absl::string_view output;
  absl::string_view pending;
};

// Built-in romaji-hiragana rules.
constexpr Rule kRomajiHiraganaRules[] = {
    {"a", "あ", ""},      {"i", "い", ""},      {"u", "う", ""},
    {"e", "え", ""},      {"o", "お", ""},      {"yi", "い", ""},
    {"wu", "う", ""},     {"ye", "いぇ", ""},   {"wha", "うぁ", ""},
    {"whi", "うぃ", ""},  {"whe", "うぇ", ""},  {"who", "うぉ", ""},
    {"wi", "うぃ", ""},   {"we", "うぇ", ""},   {"wyi", "ゐ", ""},
    {"wye", "ゑ", ""},    {"la", "ぁ", ""},     {"li", "ぃ", ""},
    {"lu", "ぅ", ""},     {"le", "ぇ", ""},     {"lo", "ぉ", ""},
    {"xa", "ぁ", ""},     {"xi", "ぃ", ""},     {"xu", "ぅ", ""},
    {"xe", "ぇ", ""},     {"xo", "ぉ", ""},     {"ka", "か", ""},
    {"ki", "き", ""},     {"ku", "く", ""},     {"ke", "け", ""},
    {"ko", "こ", ""},     {"kya", "きゃ", ""},  {"kyi", "きぃ", ""},
    {"kyu", "きゅ", ""},  {"kye", "きぇ", ""},  {"kyo", "きょ", ""},
    {"xka", "ヵ", ""},    {"xke", "ヶ", ""},    {"lka", "ヵ", ""},
    {"lke", "ヶ", ""},    {"qa", "くぁ", ""},   {"qi", "くぃ", ""},
    {"qe", "くぇ", ""},   {"qo", "くぉ", ""},   {"ga", "が", ""},
    {"gi", "ぎ", ""},     {"gu", "ぐ", ""},     {"ge", "げ", ""},
    {"go", "ご", ""},     {"gya", "ぎゃ", ""},  {"gyi", "ぎぃ", ""},
    {"gyu", "ぎゅ", ""},  {"gye", "ぎぇ", ""},  {"gyo", "ぎょ", ""},
    {"sa", "さ", ""},     {"si", "し", ""},     {"shi", "し", ""},
    {"su", "す", ""},     {"se", "せ", ""},     {"so", "そ", ""},
    {"sya", "しゃ", ""},  {"syi", "しぃ", ""},  {"syu", "しゅ", ""},
    {"sye", "しぇ", ""},  {"syo", "しょ", ""},  {"sha", "しゃ", ""},
    {"shu", "しゅ", ""},  {"she", "しぇ", ""},  {"sho", "しょ", ""},
    {"za", "ざ", ""},     {"zi", "じ", ""},     {"zu", "ず", ""},
    {"ze", "ぜ", ""},     {"zo", "ぞ", ""},     {"zya", "じゃ", ""},
    {"zyi", "じぃ", ""},  {"zyu", "じゅ", ""},  {"zye", "じぇ", ""},
    {"zyo", "じょ", ""},  {"ja", "じゃ", ""},   {"ji", "じ", ""},
    {"ju", "じゅ", ""},   {"je", "じぇ", ""},   {"jo", "じょ", ""},
    {"jya", "じゃ", ""},  {"jyi", "じぃ", ""},  {"jyu", "じゅ", ""},
    {"jye", "じぇ", ""},  {"jyo", "じょ", ""},  {"ta", "た", ""},
    {"ti", "ち", ""},     {"chi", "ち", ""},    {"tu", "つ", ""},
    {"tsu", "つ", ""},    {"te", "て", ""},     {"to", "と", ""},
    {"tya", "ちゃ", ""},  {"tyi", "ちぃ", ""},  {"tyu", "ちゅ", ""},
    {"tye", "ちぇ", ""},  {"tyo", "ちょ", ""},  {"cha", "ちゃ", ""},
    {"chu", "ちゅ", ""},  {"che", "ちぇ", ""},  {"cho", "ちょ", ""},
    {"cya", "ちゃ", ""},  {"cyi", "ちぃ", ""},  {"cyu", "ちゅ", ""},
    {"cye", "ちぇ", ""},  {"cyo", "ちょ", ""},  {"tsa", "つぁ", ""},
    {"tsi", "つぃ", ""},  {"tse", "つぇ", ""},  {"tso", "つぉ", ""},
    {"tha", "てゃ", ""},  {"thi", "てぃ", ""},  {"thu", "てゅ", ""},
    {"the", "てぇ", ""},  {"tho", "てょ", ""},  {"twu", "とぅ", ""},
    {"xtu", "っ", ""},    {"xtsu", "っ", ""},   {"ltu", "っ", ""},
    {"ltsu", "っ", ""},   {"da", "だ", ""},     {"di", "ぢ", ""},
    {"du", "づ", ""},     {"de", "で", ""},     {"do", "ど", ""},
    {"dya", "ぢゃ", ""},  {"dyi", "ぢぃ", ""},  {"dyu", "ぢゅ", ""},
    {"dye", "ぢぇ", ""},  {"dyo", "ぢょ", ""},  {"dha", "でゃ", ""},
    {"dhi", "でぃ", ""},  {"dhu", "でゅ", ""},  {"dhe", "でぇ", ""},
    {"dho", "でょ", ""},  {"dwu", "どぅ", ""},  {"na", "な", ""},
    {"ni", "に", ""},     {"nu", "ぬ", ""},     {"ne", "ね", ""},
    {"no", "の", ""},     {"nya", "にゃ", ""},  {"nyi", "にぃ", ""},
    {"nyu", "にゅ", ""},  {"nye", "にぇ", ""},  {"nyo", "にょ", ""},
    {"n", "ん", ""},      {"nn", "ん", ""},     {"n'", "ん", ""},
    {"xn", "ん", ""},     {"ha", "は", ""},     {"hi", "ひ", ""},
    {"hu", "ふ", ""},     {"he", "へ", ""},     {"ho", "ほ", ""},
    {"hya", "ひゃ", ""},  {"hyi", "ひぃ", ""},  {"hyu", "ひゅ", ""},
    {"hye", "ひぇ", ""},  {"hyo", "ひょ", ""},  {"fa", "ふぁ", ""},
    {"fi", "ふぃ", ""},   {"fu", "ふ", ""},     {"fe", "ふぇ", ""},
    {"fo", "ふぉ", ""},   {"fya", "ふゃ", ""},  {"fyu", "ふゅ", ""},
    {"fyo", "ふょ", ""},  {"ba", "ば", ""},     {"bi", "び", ""},
    {"bu", "ぶ", ""},     {"be", "べ", ""},     {"bo", "ぼ", ""},
    {"bya", "びゃ", ""},  {"byi", "びぃ", ""},  {"byu", "びゅ", ""},
    {"bye", "びぇ", ""},  {"byo", "びょ", ""},  {"pa", "ぱ", ""},
    {"pi", "ぴ", ""},     {"pu", "ぷ", ""},     {"pe", "ぺ", ""},
    {"po", "ぽ", ""},     {"pya", "ぴゃ", ""},  {"pyi", "ぴぃ", ""},
    {"pyu", "ぴゅ", ""},  {"pye", "ぴぇ", ""},  {"pyo", "ぴょ", ""},
    {"va", "ゔぁ", ""},   {"vi", "ゔぃ", ""},   {"vu", "ゔ", ""},
    {"ve", "ゔぇ", ""},   {"vo", "ゔぉ", ""},   {"ma", "ま", ""},
    {"mi", "み", ""},     {"mu", "む", ""},     {"me", "め", ""},
    {"mo", "も", ""},     {"mya", "みゃ", ""},  {"myi", "みぃ", ""},
    {"myu", "みゅ", ""},  {"mye", "みぇ", ""},  {"myo", "みょ", ""},
    {"ya", "や", ""},     {"yu", "ゆ", ""},     {"yo", "よ", ""},
    {"xya", "ゃ", ""},    {"xyu", "ゅ", ""},    {"xyo", "ょ", ""},
    {"lya", "ゃ", ""},    {"lyu", "ゅ", ""},    {"lyo", "ょ", ""},
    {"ra", "ら", ""},     {"ri", "り", ""},     {"ru", "る", ""},
    {"re", "れ", ""},     {"ro", "ろ", ""},     {"rya", "りゃ", ""},
    {"ryi", "りぃ", ""},  {"ryu", "りゅ", ""},  {"rye", "りぇ", ""},
    {"ryo", "りょ", ""},  {"wa", "わ", ""},     {"wo", "を", ""},
    {"xwa", "ゎ", ""},    {"lwa", "ゎ", ""},    {"-", "ー", ""},
    {",", "、", ""},      {".", "。", ""},      {"[", "「", ""},
    {"]", "」", ""},      {"/", "・", ""},      {"~", "〜", ""},
    {"!", "！", ""},      {"?", "？", ""},      {"z-", "〜", ""},
    {"z.", "…", ""},      {"z,", "‥", ""},      {"z/", "・", ""},
    {"z[", "『", ""},     {"z]", "』", ""},
};

// Consonants that form a sokuon "っ" when doubled, e.g. "tt" in "tta".
constexpr absl::string_view kSokuonConsonants = "bcdfghjklmpqrstvwxyz";

// Consonants after which a single "n" is committed as "ん", e.g. "nk" in
// "nka". "y" is excluded because of "nya".
constexpr absl::string_view kNConsonants = "bcdfghjklmpqrstvwxz";

std::shared_ptr<const Table> CreateDefaultTable() {
  auto table = std::make_shared<Table>();
  for (const Rule &rule : kRomajiHiraganaRules) {
    table->AddRule(rule.input, rule.output, rule.pending);
  }
  for (const char c : kSokuonConsonants) {
    const std::string consonant(1, c);
    table->AddRule(absl::StrCat(consonant, consonant), "っ", consonant);
  }
  for (const char c : kNConsonants) {
    const std::string consonant(1, c);
    table->AddRule(absl::StrCat("n", consonant), "ん", consonant);
  }
  return table;
}

}  // namespace

// ========================================
// Entry
// ========================================
Entry::Entry(const absl::string_view input, const absl::string_view result,
             const absl::string_view pending)
    : input_(input), result_(result), pending_(pending) {}

// ========================================
// Table
// ========================================
Table::Table() = default;

std::string Table::Normalize(const absl::string_view input) {
  return absl::AsciiStrToLower(input);
}

const Entry *Table::AddRule(const absl::string_view input,
                            const absl::string_view output,
                            const absl::string_view pending) {
  constexpr size_t kMaxSize = 300;
  if (input.empty() || input.size() >= kMaxSize || output.size() >= kMaxSize ||
      pending.size() >= kMaxSize) {
    LOG(ERROR) << "Invalid input/output/pending";
    return nullptr;
  }
  // A rule whose pending equals its own input never terminates.
  if (!pending.empty() && Normalize(pending) == Normalize(input)) {
    LOG(WARNING) << "Entry " << input << " " << output << " " << pending
                 << " is removed, since the rule is looping";
    return nullptr;
  }

  std::string key = Normalize(input);
  for (size_t len = 1; len < key.size(); ++len) {
    prefixes_.insert(key.substr(0, len));
  }
  auto entry = std::make_unique<Entry>(key, output, pending);
  const Entry *entry_ptr = entry.get();
  entries_[std::move(key)] = std::move(entry);
  return entry_ptr;
}

bool Table::LoadFromString(const std::string &str) {
  std::istringstream is(str);
  return LoadFromStream(&is);
}

bool Table::LoadFromFile(const std::string &filepath) {
  std::ifstream ifs(filepath);
  if (!ifs) {
    LOG(ERROR) << "Cannot open the table file: " << filepath;
    return false;
  }
  return LoadFromStream(&ifs);
}

bool Table::LoadFromStream(std::istream *is) {
  std::string line;
  size_t num_rules = 0;
  while (std::getline(*is, line)) {
    absl::string_view stripped = line;
    absl::ConsumeSuffix(&stripped, "\r");
    if (stripped.empty() || stripped[0] == '#') {
      continue;
    }

    const std::vector<absl::string_view> rules =
        absl::StrSplit(stripped, '\t', absl::AllowEmpty());
    const Entry *entry = nullptr;
    if (rules.size() == 3) {
      entry = AddRule(rules[0], rules[1], rules[2]);
    } else if (rules.size() == 2) {
      entry = AddRule(rules[0], rules[1], "");
    } else {
      LOG(ERROR) << "Format error: " << stripped;
      continue;
    }
    if (entry != nullptr) {
      ++num_rules;
    }
  }
  KANABRIDGE_VLOG(1) << num_rules << " rules are loaded";
  return true;
}

const Entry *Table::LookUp(const absl::string_view input) const {
  const auto it = entries_.find(Normalize(input));
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second.get();
}

bool Table::HasSubRules(const absl::string_view input) const {
  return prefixes_.contains(Normalize(input));
}

// static
const Table &Table::GetDefaultTable() {
  return *GetSharedDefaultTable();  // NOLINT: The referenced object has static
                                    // lifetime.
}

// static
std::shared_ptr<const Table> Table::GetSharedDefaultTable() {
  static const std::shared_ptr<const Table> *table =
      new std::shared_ptr<const Table>(CreateDefaultTable());
  return *table;
}

}  // namespace composer
}  // namespace kanabridge
