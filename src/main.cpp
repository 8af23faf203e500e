#include "analyzers/RuleEngine.hpp"
#include "analyzers/RuleRegistry.hpp"
#include "refactor/CodeFix.hpp"
#include "refactor/RefactorEngine.hpp"
#include "syntax/TreeReader.hpp"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/raw_ostream.h"
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace lfx;

static llvm::cl::OptionCategory ToolCat("lintfix options");

static llvm::cl::list<std::string> Inputs(
  llvm::cl::Positional, llvm::cl::desc("<tree files or directories>"),
  llvm::cl::ZeroOrMore, llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> Fix(
  "fix", llvm::cl::desc("Apply every offered fix and print the rewritten source"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> Output(
  "o", llvm::cl::desc("Write the rewritten source to <file> (single input only)"),
  llvm::cl::value_desc("file"), llvm::cl::init(""), llvm::cl::cat(ToolCat));

static llvm::cl::opt<unsigned> LangVersion(
  "lang-version", llvm::cl::desc("Target language version (collection literals need 12)"),
  llvm::cl::init(12), llvm::cl::cat(ToolCat));

static llvm::cl::list<std::string> Enable(
  "enable", llvm::cl::desc("Run only these rule ids"),
  llvm::cl::CommaSeparated, llvm::cl::cat(ToolCat));

static llvm::cl::list<std::string> Disable(
  "disable", llvm::cl::desc("Do not run these rule ids"),
  llvm::cl::CommaSeparated, llvm::cl::cat(ToolCat));

static llvm::cl::opt<unsigned> Jobs(
  "jobs", llvm::cl::desc("Worker threads per analysis pass"),
  llvm::cl::init(1), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> ListRules(
  "list-rules", llvm::cl::desc("Print the known rules and exit"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> AnalyzeGenerated(
  "analyze-generated", llvm::cl::desc("Also analyze generated sources (*.g.cs, *.designer.cs)"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static bool writeOutput(const std::string& path, const std::string& text) {
  std::error_code ec;
  llvm::raw_fd_ostream os(path, ec);
  if (ec) {
    llvm::errs() << "lintfix: cannot write " << path << ": " << ec.message() << "\n";
    return false;
  }
  os << text;
  return true;
}

int main(int argc, const char** argv) {
  llvm::cl::HideUnrelatedOptions(ToolCat);
  llvm::cl::ParseCommandLineOptions(argc, argv, "Rule-based diagnostics and fixes for C# syntax trees\n");

  auto registry = RuleRegistry::withBuiltinRules();

  if (ListRules) {
    for (const auto& d : registry.supportedRules()) {
      std::cout << d.id << " [" << severityName(d.severity) << ", " << d.category << "] "
                << d.title << "\n  " << d.helpLink << "\n";
    }
    return 0;
  }
  std::vector<std::string> files;

  // Expand directories recursively
  auto addPath = [&](const std::string& p) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::file_status st = fs::status(p, ec);
    if (ec) {
      files.push_back(p);  // let the reader report it
      return;
    }
    if (fs::is_directory(st)) {
      for (auto& e : fs::recursive_directory_iterator(p, fs::directory_options::follow_directory_symlink, ec)) {
        if (e.path().extension() == ".tree") files.push_back(e.path().string());
      }
    } else {
      files.push_back(p);
    }
  };
  for (const auto& p : Inputs) addPath(p);

  if (files.empty()) {
    std::cerr << "lintfix: no input tree files\n";
    return 1;
  }
  if (!Output.empty() && files.size() != 1) {
    std::cerr << "lintfix: -o needs exactly one input\n";
    return 1;
  }

  AnalyzeOptions opts;
  opts.enabledRules.assign(Enable.begin(), Enable.end());
  opts.disabledRules.assign(Disable.begin(), Disable.end());
  opts.jobs = Jobs;
  opts.analyzeGeneratedCode = AnalyzeGenerated;

  LanguageOptions lang;
  lang.languageVersion = LangVersion;

  RuleEngine engine(registry, opts);
  auto fixes = CodeFixService::withBuiltinFixes(lang);

  int status = 0;
  for (const auto& path : files) {
    TreeFile input;
    std::string err;
    if (!readTreeFile(path, input, &err)) {
      std::cerr << "lintfix: " << err << "\n";
      status = 1;
      continue;
    }
    const auto& tree = *input.tree;
    auto result = engine.analyze(tree, *input.semantics);
    fixes.attachFixes(result.findings, tree);

    const auto& file = tree.path().empty() ? path : tree.path();
    for (const auto& f : result.findings) {
      std::cout << file << ":" << f.span.line << ":" << f.span.column << ": "
                << severityName(f.severity) << ": " << f.message << " [" << f.ruleId << "]\n";
      for (const auto& x : f.fixes) std::cout << "  fix: " << x.title << "\n";
    }

    if (!Fix) continue;

    std::vector<FixProposal> all;
    for (auto& f : result.findings)
      for (auto& x : f.fixes) all.push_back(std::move(x));
    auto batch = RefactorEngine::applyAll(tree, all);
    if (!batch.skipped.empty())
      std::cerr << "lintfix: " << file << ": skipped " << batch.skipped.size()
                << " conflicting fix(es)\n";

    if (!Output.empty()) {
      if (!writeOutput(Output, batch.tree.text())) status = 1;
    } else {
      std::cout << "\n" << batch.tree.text() << "\n";
    }
  }
  return status;
}
