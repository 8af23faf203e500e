#include "analyzers/RuleEngine.hpp"

#include "llvm/Support/ThreadPool.h"
#include "llvm/Support/Threading.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <iterator>

namespace lfx {

void RuleContext::report(const RuleDescriptor& d, const SyntaxNode& at) const {
  Finding f;
  f.ruleId = d.id;
  f.severity = d.severity;
  f.message = d.message;
  f.file = Tree.path();
  f.span = Tree.span(at).value_or(Span{});
  Out.push_back(std::move(f));
}

static bool endsWith(const std::string& s, const char* suffix) {
  std::string x(suffix);
  return s.size() >= x.size() && s.compare(s.size() - x.size(), x.size(), x) == 0;
}

bool RuleEngine::isGeneratedPath(const std::string& path) {
  return endsWith(path, ".g.cs") || endsWith(path, ".generated.cs") ||
         endsWith(path, ".designer.cs") || endsWith(path, ".Designer.cs");
}

RuleEngine::RuleEngine(const RuleRegistry& registry, AnalyzeOptions opts, llvm::raw_ostream* log)
  : Registry(registry), Opts(std::move(opts)), Log(log ? log : &llvm::errs()) {
  auto listed = [](const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
  };
  for (const auto& d : Registry.supportedRules()) {
    bool on = Opts.enabledRules.empty() ? d.enabledByDefault : listed(Opts.enabledRules, d.id);
    if (on && !listed(Opts.disabledRules, d.id)) ActiveIds.insert(d.id);
  }

  for (const auto& rule : Registry.rules()) {
    auto ds = rule->descriptors();
    bool active = std::any_of(ds.begin(), ds.end(),
                              [&](const RuleDescriptor& d) { return isActive(d.id); });
    if (!active) continue;
    for (const auto& t : rule->triggers()) {
      auto& subs = t.domain == Trigger::Domain::Syntax ? BySyntax.at(t.kind) : ByOperation.at(t.kind);
      if (std::find(subs.begin(), subs.end(), rule.get()) == subs.end()) subs.push_back(rule.get());
    }
  }
}

std::vector<RuleDescriptor> RuleEngine::supportedRules() const {
  std::vector<RuleDescriptor> out;
  for (const auto& d : Registry.supportedRules())
    if (isActive(d.id)) out.push_back(d);
  return out;
}

void RuleEngine::runRule(const Rule& rule, const SyntaxTree& tree, const SymbolResolver& resolver,
                         const SyntaxNode& node, std::vector<Finding>& out,
                         std::vector<EngineFault>& faults) const {
  // A rule that throws loses whatever it reported at this node.
  std::vector<Finding> local;
  RuleContext ctx(tree, resolver, node, local);
  auto fault = [&](std::string what) {
    auto ds = rule.descriptors();
    faults.push_back({ds.empty() ? "?" : ds.front().id, tree.path(),
                      tree.span(node).value_or(Span{}), std::move(what)});
  };
  try {
    rule.evaluate(ctx);
  } catch (const std::exception& e) {
    fault(e.what());
    return;
  } catch (...) {
    fault("unknown exception");
    return;
  }
  for (auto& f : local)
    if (isActive(f.ruleId)) out.push_back(std::move(f));
}

void RuleEngine::visit(const SyntaxTree& tree, const SymbolResolver& resolver, const SyntaxNode& node,
                       std::vector<Finding>& out, std::vector<EngineFault>& faults) const {
  for (const auto* rule : BySyntax[static_cast<size_t>(node.kind)])
    runRule(*rule, tree, resolver, node, out, faults);

  auto op = resolver.operationOf(node);
  if (!op) return;
  for (const auto* rule : ByOperation[static_cast<size_t>(*op)])
    runRule(*rule, tree, resolver, node, out, faults);
}

AnalysisResult RuleEngine::analyze(const SyntaxTree& tree, const SymbolResolver& resolver) const {
  AnalysisResult result;
  if (!Opts.analyzeGeneratedCode && isGeneratedPath(tree.path())) {
    result.skippedGenerated = true;
    return result;
  }

  auto cancelled = [this] { return Opts.cancel && Opts.cancel->load(std::memory_order_relaxed); };
  const auto& nodes = tree.preorder();

  // Never more workers than nodes.
  size_t jobs = std::min<size_t>(Opts.jobs, nodes.size());
  if (jobs <= 1 || nodes.size() < 2 * jobs) {
    for (const auto* n : nodes) {
      if (cancelled()) { result.cancelled = true; break; }
      visit(tree, resolver, *n, result.findings, result.faults);
    }
  } else {
    // One buffer per chunk, merged in chunk order: same output as the
    // sequential walk whatever the scheduling.
    struct Chunk {
      size_t begin = 0, end = 0;
      std::vector<Finding> findings;
      std::vector<EngineFault> faults;
      bool cancelled = false;
    };
    size_t count = std::min(nodes.size(), jobs * 4);
    size_t step = (nodes.size() + count - 1) / count;
    std::vector<Chunk> chunks;
    for (size_t b = 0; b < nodes.size(); b += step)
      chunks.push_back({b, std::min(nodes.size(), b + step), {}, {}, false});

    llvm::ThreadPool pool(llvm::hardware_concurrency(static_cast<unsigned>(jobs)));
    for (auto& c : chunks) {
      pool.async([&, chunk = &c] {
        for (size_t i = chunk->begin; i < chunk->end; ++i) {
          if (cancelled()) { chunk->cancelled = true; return; }
          visit(tree, resolver, *nodes[i], chunk->findings, chunk->faults);
        }
      });
    }
    pool.wait();

    for (auto& c : chunks) {
      std::move(c.findings.begin(), c.findings.end(), std::back_inserter(result.findings));
      std::move(c.faults.begin(), c.faults.end(), std::back_inserter(result.faults));
      if (c.cancelled) { result.cancelled = true; break; }
    }
  }

  for (const auto& f : result.faults) {
    *Log << "lintfix: internal error: rule " << f.ruleId << " failed at "
         << (f.file.empty() ? "<tree>" : f.file) << ":" << f.span.line << ":"
         << f.span.column << ": " << f.what << "\n";
  }
  return result;
}

} // namespace lfx
