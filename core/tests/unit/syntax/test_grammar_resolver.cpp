// test_grammar_resolver.cpp - Provider chain, normalization and caching

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "tierflow/syntax/grammar_resolver.hpp"

using tierflow::Grammar;
using tierflow::GrammarProvider;
using tierflow::GrammarResolver;

namespace
{

// Placeholder language pointers; the resolver never dereferences them.
const TSLanguage * fake_language(int n)
{
  static const char storage[4] = {};
  return reinterpret_cast<const TSLanguage *>(&storage[n]);
}

class FakeProvider : public GrammarProvider
{
public:
  FakeProvider(std::string name, std::vector<std::string> languages, int * calls)
  : name_(std::move(name)), languages_(std::move(languages)), calls_(calls)
  {
  }

  [[nodiscard]] std::string_view name() const noexcept override { return name_; }

  [[nodiscard]] std::optional<Grammar> try_resolve(const std::string & language) override
  {
    ++*calls_;
    for (size_t i = 0; i < languages_.size(); ++i) {
      if (languages_[i] == language) {
        Grammar g;
        g.language = language;
        g.provider = name_;
        g.ts_language = fake_language(static_cast<int>(i % 4));
        return g;
      }
    }
    return std::nullopt;
  }

private:
  std::string name_;
  std::vector<std::string> languages_;
  int * calls_;
};

/// Throws for one language, misses for everything else.
class ThrowingProvider : public GrammarProvider
{
public:
  explicit ThrowingProvider(std::string poisoned) : poisoned_(std::move(poisoned)) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "throwing"; }

  [[nodiscard]] std::optional<Grammar> try_resolve(const std::string & language) override
  {
    if (language == poisoned_) {
      throw std::runtime_error("corrupt grammar object");
    }
    return std::nullopt;
  }

private:
  std::string poisoned_;
};

GrammarResolver make_resolver(std::vector<std::string> languages, int * calls)
{
  std::vector<std::unique_ptr<GrammarProvider>> providers;
  providers.push_back(std::make_unique<FakeProvider>("fake", std::move(languages), calls));
  return GrammarResolver(std::move(providers));
}

}  // namespace

TEST(GrammarResolver, NormalizesCaseAndWhitespace)
{
  int calls = 0;
  auto resolver = make_resolver({"python"}, &calls);

  const Grammar * a = resolver.resolve("Python");
  const Grammar * b = resolver.resolve("python ");
  const Grammar * c = resolver.resolve("  PYTHON\t");

  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a, b);
  EXPECT_EQ(a, c);
  EXPECT_EQ(a->language, "python");
  EXPECT_EQ(resolver.resolution_count(), 1u);
  EXPECT_EQ(calls, 1);
}

TEST(GrammarResolver, UnknownLanguageIsNotSupported)
{
  int calls = 0;
  auto resolver = make_resolver({"python"}, &calls);

  EXPECT_EQ(resolver.resolve("cobol"), nullptr);
  EXPECT_FALSE(resolver.is_supported("cobol"));
  EXPECT_EQ(resolver.cache_size(), 0u);
}

TEST(GrammarResolver, EmptyNameIsNotSupported)
{
  int calls = 0;
  auto resolver = make_resolver({"python"}, &calls);

  EXPECT_EQ(resolver.resolve("   "), nullptr);
  EXPECT_EQ(calls, 0);
}

TEST(GrammarResolver, FailuresAreNotCached)
{
  int calls = 0;
  auto resolver = make_resolver({}, &calls);

  EXPECT_EQ(resolver.resolve("rust"), nullptr);
  EXPECT_EQ(resolver.resolve("rust"), nullptr);
  EXPECT_EQ(calls, 2);
}

TEST(GrammarResolver, FirstProviderWins)
{
  int first_calls = 0;
  int second_calls = 0;
  std::vector<std::unique_ptr<GrammarProvider>> providers;
  providers.push_back(
    std::make_unique<FakeProvider>("first", std::vector<std::string>{"go"}, &first_calls));
  providers.push_back(std::make_unique<FakeProvider>(
    "second", std::vector<std::string>{"go", "java"}, &second_calls));
  GrammarResolver resolver(std::move(providers));

  const Grammar * go = resolver.resolve("go");
  ASSERT_NE(go, nullptr);
  EXPECT_EQ(go->provider, "first");
  EXPECT_EQ(second_calls, 0);

  const Grammar * java = resolver.resolve("java");
  ASSERT_NE(java, nullptr);
  EXPECT_EQ(java->provider, "second");
  EXPECT_EQ(resolver.cache_size(), 2u);
}

TEST(GrammarResolver, ThrowingProviderOnlyAffectsThatLanguage)
{
  int calls = 0;
  std::vector<std::unique_ptr<GrammarProvider>> providers;
  providers.push_back(std::make_unique<ThrowingProvider>("ruby"));
  providers.push_back(
    std::make_unique<FakeProvider>("fake", std::vector<std::string>{"python"}, &calls));
  GrammarResolver resolver(std::move(providers));

  // The throw is a miss; the next provider does not know ruby either.
  EXPECT_EQ(resolver.resolve("ruby"), nullptr);

  const Grammar * py = resolver.resolve("python");
  ASSERT_NE(py, nullptr);
  EXPECT_EQ(py->provider, "fake");
}

TEST(GrammarResolver, AddProviderExtendsTheChain)
{
  int calls = 0;
  GrammarResolver resolver;
  EXPECT_EQ(resolver.resolve("kotlin"), nullptr);

  resolver.add_provider(
    std::make_unique<FakeProvider>("late", std::vector<std::string>{"kotlin"}, &calls));
  EXPECT_NE(resolver.resolve("kotlin"), nullptr);
}

TEST(GrammarResolver, ConcurrentResolveLoadsOnce)
{
  int calls = 0;
  auto resolver = make_resolver({"python"}, &calls);

  std::vector<const Grammar *> seen(8, nullptr);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < seen.size(); ++i) {
    threads.emplace_back([&, i] { seen[i] = resolver.resolve("python"); });
  }
  for (auto & t : threads) {
    t.join();
  }

  for (const Grammar * g : seen) {
    EXPECT_EQ(g, seen.front());
  }
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(resolver.resolution_count(), 1u);
}

TEST(GrammarResolver, CountersReadableWhileResolving)
{
  int calls = 0;
  auto resolver = make_resolver({"python", "go", "rust", "ruby"}, &calls);
  const std::vector<std::string> names{"python", "go", "rust", "ruby"};

  std::vector<size_t> observed(4, 0);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < names.size(); ++i) {
    threads.emplace_back([&, i] { (void)resolver.resolve(names[i]); });
    threads.emplace_back([&, i] {
      observed[i] = std::max(resolver.resolution_count(), resolver.cache_size());
    });
  }
  for (auto & t : threads) {
    t.join();
  }

  for (const size_t n : observed) {
    EXPECT_LE(n, names.size());
  }
  EXPECT_EQ(resolver.resolution_count(), names.size());
  EXPECT_EQ(resolver.cache_size(), names.size());
}

TEST(GrammarResolver, SymbolNameReplacesDashes)
{
  EXPECT_EQ(tierflow::grammar_symbol_name("python"), "tree_sitter_python");
  EXPECT_EQ(tierflow::grammar_symbol_name("c-sharp"), "tree_sitter_c_sharp");
}

TEST(GrammarResolver, MissingSharedLibraryIsAMiss)
{
  tierflow::SharedLibraryGrammarProvider provider;
  EXPECT_FALSE(provider.try_resolve("no-such-language-xyz").has_value());

  tierflow::GrammarDirectoryProvider dirs({"/nonexistent/grammar/dir"});
  EXPECT_FALSE(dirs.try_resolve("python").has_value());
}

TEST(GrammarResolver, BuiltinRejectsNullEntryPoint)
{
  tierflow::BuiltinGrammarProvider builtin;
  builtin.register_language(" NullLang ", []() -> const TSLanguage * { return nullptr; });

  const auto names = builtin.languages();
  EXPECT_NE(std::find(names.begin(), names.end(), "nulllang"), names.end());
  EXPECT_FALSE(builtin.try_resolve("nulllang").has_value());
  EXPECT_FALSE(builtin.try_resolve("not-registered-anywhere").has_value());
}
