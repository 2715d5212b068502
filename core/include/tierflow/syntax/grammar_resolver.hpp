// tierflow/syntax/grammar_resolver.hpp - Language name -> tree-sitter grammar
//
// Resolves a language name to a loaded grammar by asking an ordered list of
// providers. The first provider that yields a grammar wins and the result is
// memoized for the lifetime of the resolver.
//
#pragma once

#include <tree_sitter/api.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tierflow
{

// ============================================================================
// Grammar
// ============================================================================

/**
 * A loaded grammar for one language.
 *
 * `keepalive` owns whatever backs `language` (e.g. a dlopen handle); the
 * language pointer is valid as long as the Grammar is alive.
 */
struct Grammar
{
  std::string language;
  std::string provider;
  const TSLanguage * ts_language = nullptr;
  std::shared_ptr<void> keepalive;
};

/// Language entry point exported by a tree-sitter grammar.
using LanguageFn = const TSLanguage * (*)();

/// Trim surrounding whitespace and lower-case ASCII letters.
[[nodiscard]] std::string normalize_language_name(std::string_view language);

// ============================================================================
// Providers
// ============================================================================

/**
 * One back-end able to produce grammars.
 *
 * Implementations return std::nullopt when they do not know the language.
 * They may throw on unexpected failures; the resolver treats that as a miss
 * for the requested language only.
 */
class GrammarProvider
{
public:
  virtual ~GrammarProvider() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  /// @param language normalized language name
  [[nodiscard]] virtual std::optional<Grammar> try_resolve(const std::string & language) = 0;
};

/**
 * Grammars linked into the binary.
 */
class BuiltinGrammarProvider : public GrammarProvider
{
public:
  /// Seeded with the grammars the build found (see builtin_grammars.cpp.in).
  BuiltinGrammarProvider();

  void register_language(std::string_view language, LanguageFn fn);

  [[nodiscard]] std::vector<std::string> languages() const;

  [[nodiscard]] std::string_view name() const noexcept override { return "builtin"; }
  [[nodiscard]] std::optional<Grammar> try_resolve(const std::string & language) override;

private:
  std::unordered_map<std::string, LanguageFn> table_;
};

/**
 * Grammars packaged as shared objects and found through the dynamic loader
 * search path (libtree-sitter-<lang>.so).
 */
class SharedLibraryGrammarProvider : public GrammarProvider
{
public:
  [[nodiscard]] std::string_view name() const noexcept override { return "shared-library"; }
  [[nodiscard]] std::optional<Grammar> try_resolve(const std::string & language) override;
};

/**
 * Grammars compiled into a directory, e.g. by `tree-sitter build`.
 */
class GrammarDirectoryProvider : public GrammarProvider
{
public:
  explicit GrammarDirectoryProvider(std::vector<std::filesystem::path> search_paths);

  [[nodiscard]] std::string_view name() const noexcept override { return "grammar-directory"; }
  [[nodiscard]] std::optional<Grammar> try_resolve(const std::string & language) override;

private:
  std::vector<std::filesystem::path> search_paths_;
};

/// Name of the symbol a grammar exports, e.g. "c-sharp" -> "tree_sitter_c_sharp".
[[nodiscard]] std::string grammar_symbol_name(std::string_view language);

/**
 * Load `symbol` from the shared object at `library` (a path or a bare
 * soname). Returns std::nullopt if the object or symbol is missing.
 */
[[nodiscard]] std::optional<Grammar> load_grammar_library(
  const std::string & library, const std::string & symbol, const std::string & language,
  std::string_view provider);

// ============================================================================
// GrammarResolver
// ============================================================================

/**
 * Owns the provider chain and the per-language cache.
 *
 * Cache lifecycle: populated on first successful lookup, never evicted.
 * Failed lookups are not cached.
 */
class GrammarResolver
{
public:
  GrammarResolver() = default;
  explicit GrammarResolver(std::vector<std::unique_ptr<GrammarProvider>> providers);

  GrammarResolver(const GrammarResolver &) = delete;
  GrammarResolver & operator=(const GrammarResolver &) = delete;

  /// builtin -> shared-library -> grammar-directory(search_paths)
  [[nodiscard]] static GrammarResolver with_default_providers(
    std::vector<std::filesystem::path> search_paths = {});

  void add_provider(std::unique_ptr<GrammarProvider> provider);

  /**
   * Resolve a language name.
   *
   * @param language case-insensitive name, surrounding whitespace ignored
   * @return the cached grammar, or nullptr when no provider supports it
   */
  [[nodiscard]] const Grammar * resolve(std::string_view language);

  [[nodiscard]] bool is_supported(std::string_view language)
  {
    return resolve(language) != nullptr;
  }

  /// Number of successful provider lookups (one per cached language).
  [[nodiscard]] size_t resolution_count() const;

  [[nodiscard]] size_t cache_size() const;

private:
  std::vector<std::unique_ptr<GrammarProvider>> providers_;
  std::unordered_map<std::string, std::unique_ptr<const Grammar>> cache_;
  mutable std::mutex mutex_;
  size_t resolution_count_ = 0;
};

}  // namespace tierflow
