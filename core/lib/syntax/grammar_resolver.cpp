// tierflow/syntax/grammar_resolver.cpp - Grammar provider chain and cache
//
#include "tierflow/syntax/grammar_resolver.hpp"

#include <dlfcn.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

#include "tierflow/basic/text.hpp"
#include "tierflow/syntax/ts_ll.hpp"

namespace fs = std::filesystem;

namespace tierflow
{

// Generated at configure time from the grammars found by the build.
void register_builtin_grammars(BuiltinGrammarProvider & provider);

std::string normalize_language_name(std::string_view language)
{
  return normalize_key(language);
}

std::string grammar_symbol_name(std::string_view language)
{
  std::string symbol = "tree_sitter_";
  for (const char c : language) {
    symbol.push_back(c == '-' ? '_' : c);
  }
  return symbol;
}

std::optional<Grammar> load_grammar_library(
  const std::string & library, const std::string & symbol, const std::string & language,
  std::string_view provider)
{
  void * handle = ::dlopen(library.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle) {
    spdlog::debug("grammar: dlopen({}) failed: {}", library, ::dlerror());
    return std::nullopt;
  }

  // Keep the object loaded for as long as any Grammar refers to it.
  std::shared_ptr<void> keepalive(handle, [](void * h) { ::dlclose(h); });

  ::dlerror();
  void * sym = ::dlsym(handle, symbol.c_str());
  if (!sym) {
    spdlog::debug("grammar: {} has no symbol {}", library, symbol);
    return std::nullopt;
  }

  const auto fn = reinterpret_cast<LanguageFn>(sym);
  const TSLanguage * lang = fn();
  if (!ts_ll::is_compatible_language(lang)) {
    spdlog::warn("grammar: {} from {} has an incompatible ABI version", language, library);
    return std::nullopt;
  }

  Grammar g;
  g.language = language;
  g.provider = std::string(provider);
  g.ts_language = lang;
  g.keepalive = std::move(keepalive);
  return g;
}

// ============================================================================
// BuiltinGrammarProvider
// ============================================================================

BuiltinGrammarProvider::BuiltinGrammarProvider() { register_builtin_grammars(*this); }

void BuiltinGrammarProvider::register_language(std::string_view language, LanguageFn fn)
{
  table_[normalize_language_name(language)] = fn;
}

std::vector<std::string> BuiltinGrammarProvider::languages() const
{
  std::vector<std::string> out;
  out.reserve(table_.size());
  for (const auto & [name, fn] : table_) {
    out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::optional<Grammar> BuiltinGrammarProvider::try_resolve(const std::string & language)
{
  const auto it = table_.find(language);
  if (it == table_.end() || !it->second) {
    return std::nullopt;
  }

  const TSLanguage * lang = it->second();
  if (!ts_ll::is_compatible_language(lang)) {
    spdlog::warn("grammar: builtin {} has an incompatible ABI version", language);
    return std::nullopt;
  }

  Grammar g;
  g.language = language;
  g.provider = std::string(name());
  g.ts_language = lang;
  return g;
}

// ============================================================================
// SharedLibraryGrammarProvider
// ============================================================================

std::optional<Grammar> SharedLibraryGrammarProvider::try_resolve(const std::string & language)
{
  return load_grammar_library(
    "libtree-sitter-" + language + ".so", grammar_symbol_name(language), language, name());
}

// ============================================================================
// GrammarDirectoryProvider
// ============================================================================

GrammarDirectoryProvider::GrammarDirectoryProvider(std::vector<fs::path> search_paths)
: search_paths_(std::move(search_paths))
{
}

std::optional<Grammar> GrammarDirectoryProvider::try_resolve(const std::string & language)
{
  const std::string symbol = grammar_symbol_name(language);
  const std::string candidates[] = {"libtree-sitter-" + language + ".so", language + ".so"};

  for (const auto & dir : search_paths_) {
    for (const auto & file : candidates) {
      const fs::path candidate = dir / file;
      std::error_code ec;
      if (!fs::is_regular_file(candidate, ec)) continue;

      // dlopen only searches the loader path for bare names; pass an absolute path.
      auto g =
        load_grammar_library(fs::absolute(candidate, ec).string(), symbol, language, name());
      if (g) return g;
    }
  }
  return std::nullopt;
}

// ============================================================================
// GrammarResolver
// ============================================================================

GrammarResolver::GrammarResolver(std::vector<std::unique_ptr<GrammarProvider>> providers)
: providers_(std::move(providers))
{
}

GrammarResolver GrammarResolver::with_default_providers(std::vector<fs::path> search_paths)
{
  std::vector<std::unique_ptr<GrammarProvider>> providers;
  providers.push_back(std::make_unique<BuiltinGrammarProvider>());
  providers.push_back(std::make_unique<SharedLibraryGrammarProvider>());
  if (!search_paths.empty()) {
    providers.push_back(std::make_unique<GrammarDirectoryProvider>(std::move(search_paths)));
  }
  return GrammarResolver(std::move(providers));
}

void GrammarResolver::add_provider(std::unique_ptr<GrammarProvider> provider)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  providers_.push_back(std::move(provider));
}

const Grammar * GrammarResolver::resolve(std::string_view language)
{
  const std::string key = normalize_language_name(language);
  if (key.empty()) return nullptr;

  // The lock is held across the provider walk so a language is loaded at most once.
  const std::lock_guard<std::mutex> lock(mutex_);

  if (const auto it = cache_.find(key); it != cache_.end()) {
    return it->second.get();
  }

  for (const auto & provider : providers_) {
    std::optional<Grammar> found;
    try {
      found = provider->try_resolve(key);
    } catch (const std::exception & e) {
      spdlog::warn("grammar: provider '{}' failed for '{}': {}", provider->name(), key, e.what());
      continue;
    }
    if (!found) continue;

    spdlog::debug("grammar: '{}' resolved by provider '{}'", key, provider->name());
    auto entry = std::make_unique<const Grammar>(std::move(*found));
    const Grammar * out = entry.get();
    cache_.emplace(key, std::move(entry));
    ++resolution_count_;
    return out;
  }

  spdlog::debug("grammar: no provider supports '{}'", key);
  return nullptr;
}

size_t GrammarResolver::resolution_count() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return resolution_count_;
}

size_t GrammarResolver::cache_size() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

}  // namespace tierflow
