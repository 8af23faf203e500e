#pragma once
#include "syntax/SyntaxNode.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace lfx {

// Renders syntax to canonical C#-style text: tab indentation, braces on
// their own line, single spaces around binary operators and after commas.
// Optionally reports the [begin, end) offsets of every node it writes.
class SourceWriter {
public:
  using SpanSink = std::function<void(const SyntaxNode& node, const SyntaxNode* parent,
                                      unsigned begin, unsigned end)>;

  SourceWriter() = default;
  explicit SourceWriter(SpanSink sink) : Sink(std::move(sink)) {}

  std::string render(const SyntaxNode& root);

  static std::string toSource(const SyntaxNode& n) { return SourceWriter().render(n); }

private:
  void emit(const SyntaxNode& n, const SyntaxNode* parent);
  void emitChild(const SyntaxNode& n, size_t i);
  void joinChildren(const SyntaxNode& n, size_t from, std::string_view sep);
  void body(const SyntaxNode& n, size_t from, bool blankBetween);
  void write(std::string_view s) { Out.append(s.data(), s.size()); }
  void newline();

  std::string Out;
  int Depth = 0;
  SpanSink Sink;
};

} // namespace lfx
