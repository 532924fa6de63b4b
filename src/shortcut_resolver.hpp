#pragma once
/*
 * ShortcutResolver
 *
 * Purpose: map (key, modifiers) events to editor commands through a binding table.
 * Design: bindings are data. Portable bindings use the logical "primary" modifier;
 *         a per-platform table says which physical modifier is primary. Platform
 *         overrides are layered on top and win on an exact chord collision.
 *         The lookup map is compiled lazily after the table or platform changes.
 */
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "keys.hpp"
#include "commands.hpp"

enum class Platform { Linux, Windows, MacOS };
inline constexpr size_t kPlatformCount = 3;

const char* platform_name(Platform p);
bool parse_platform(std::string_view name, Platform& out);

/* physical modifier that acts as "primary" on each platform */
struct ModifierConvention {
  Platform platform;
  Modifier primary;
};

struct ShortcutBinding {
  Chord chord;
  Command action;
  std::string description;
  std::optional<Platform> platform; /* set for overrides only */
  uint64_t seq = 0;                  /* bind order, assigned by the table */
};

class ShortcutTable {
public:
  /* add or replace; the binding gets the next sequence number */
  void bind(ShortcutBinding b);
  bool unbind(const Chord& chord, std::optional<Platform> platform = std::nullopt);
  void clear();
  const ShortcutBinding* find(const Chord& chord, std::optional<Platform> platform = std::nullopt) const;
  std::vector<ShortcutBinding> bindings() const;
  const std::unordered_map<Chord, ShortcutBinding, ChordHash>& portable() const { return portable_; }
  const std::unordered_map<Chord, ShortcutBinding, ChordHash>& overrides(Platform p) const {
    return overrides_[static_cast<size_t>(p)];
  }

private:
  uint64_t next_seq_ = 0;
  std::unordered_map<Chord, ShortcutBinding, ChordHash> portable_;
  std::array<std::unordered_map<Chord, ShortcutBinding, ChordHash>, kPlatformCount> overrides_;
};

struct Resolution {
  enum class Kind { Command, Character, Unhandled };
  Kind kind = Kind::Unhandled;
  Command command;
  const ShortcutBinding* binding = nullptr; /* valid until the table changes */
};

class ShortcutResolver {
public:
  explicit ShortcutResolver(Platform platform = Platform::Linux);

  Platform platform() const { return platform_; }
  void set_platform(Platform p);
  void set_conventions(std::vector<ModifierConvention> conventions);
  Modifier primary_modifier() const;

  void bind(ShortcutBinding b);
  /* text form, e.g. bind("primary+d", "select_word") */
  bool bind(std::string_view chord, std::string_view command, std::string description = {},
            std::optional<Platform> platform = std::nullopt);
  bool unbind(std::string_view chord, std::optional<Platform> platform = std::nullopt);
  bool unbind(const Chord& chord, std::optional<Platform> platform = std::nullopt);
  void load_defaults();
  void clear();

  const ShortcutTable& table() const { return table_; }
  std::vector<ShortcutBinding> bindings() const { return table_.bindings(); }

  /* physical primary modifier folded into MOD_PRIMARY */
  Modifiers normalize(Modifiers raw) const;
  Resolution resolve(const KeyEvent& ev) const;

private:
  void compile() const;

  Platform platform_;
  std::vector<ModifierConvention> conventions_;
  ShortcutTable table_;
  mutable std::unordered_map<Chord, const ShortcutBinding*, ChordHash> compiled_;
  mutable bool dirty_ = true;
};
