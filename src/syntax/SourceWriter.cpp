#include "syntax/SourceWriter.hpp"

namespace lfx {

std::string SourceWriter::render(const SyntaxNode& root) {
  Out.clear();
  Depth = 0;
  emit(root, nullptr);
  return Out;
}

void SourceWriter::newline() {
  Out += '\n';
  Out.append(static_cast<size_t>(Depth), '\t');
}

void SourceWriter::emitChild(const SyntaxNode& n, size_t i) {
  if (const auto* c = n.child(i)) emit(*c, &n);
}

void SourceWriter::joinChildren(const SyntaxNode& n, size_t from, std::string_view sep) {
  for (size_t i = from; i < n.children.size(); ++i) {
    if (i > from) write(sep);
    emitChild(n, i);
  }
}

// "{", one member per line, "}" with the members one level deeper.
void SourceWriter::body(const SyntaxNode& n, size_t from, bool blankBetween) {
  newline();
  write("{");
  ++Depth;
  for (size_t i = from; i < n.children.size(); ++i) {
    if (blankBetween && i > from) Out += '\n';
    newline();
    emitChild(n, i);
  }
  --Depth;
  newline();
  write("}");
}

void SourceWriter::emit(const SyntaxNode& n, const SyntaxNode* parent) {
  auto begin = static_cast<unsigned>(Out.size());

  switch (n.kind) {
  case NodeKind::CompilationUnit:
    for (size_t i = 0; i < n.children.size(); ++i) {
      if (i > 0) {
        Out += '\n';
        auto* prev = n.child(i - 1);
        auto* cur = n.child(i);
        bool usings = prev && prev->is(NodeKind::UsingDirective) &&
                      cur && cur->is(NodeKind::UsingDirective);
        if (!usings) Out += '\n';
      }
      emitChild(n, i);
    }
    break;
  case NodeKind::UsingDirective:
    write("using "); write(n.text); write(";");
    break;
  case NodeKind::NamespaceDecl:
    write("namespace "); write(n.text);
    body(n, 0, true);
    break;
  case NodeKind::ClassDecl:
    write("public class "); write(n.text);
    body(n, 0, true);
    break;
  case NodeKind::MethodDecl:
    write("public ");
    emitChild(n, 0);
    write(" "); write(n.text);
    emitChild(n, 1);
    emitChild(n, 2);
    break;
  case NodeKind::ParameterList:
  case NodeKind::ArgumentList:
    write("(");
    joinChildren(n, 0, ", ");
    write(")");
    break;
  case NodeKind::Parameter:
    emitChild(n, 0);
    write(" "); write(n.text);
    break;
  case NodeKind::Block:
    body(n, 0, false);
    break;
  case NodeKind::LocalDeclaration:
    emitChild(n, 0);
    write(" "); write(n.text);
    if (n.child(1)) {
      write(" = ");
      emitChild(n, 1);
    }
    write(";");
    break;
  case NodeKind::ExpressionStatement:
    emitChild(n, 0);
    write(";");
    break;
  case NodeKind::ReturnStatement:
    write("return");
    if (n.child(0)) {
      write(" ");
      emitChild(n, 0);
    }
    write(";");
    break;
  case NodeKind::TypeName:
  case NodeKind::IdentifierName:
  case NodeKind::NumericLiteral:
  case NodeKind::InterpolatedText:
    write(n.text);
    break;
  case NodeKind::StringLiteral:
    write("\""); write(n.text); write("\"");
    break;
  case NodeKind::TrueLiteral:  write("true"); break;
  case NodeKind::FalseLiteral: write("false"); break;
  case NodeKind::NullLiteral:  write("null"); break;
  case NodeKind::MemberAccess:
    emitChild(n, 0);
    write(".");
    emitChild(n, 1);
    break;
  case NodeKind::MemberBinding:
    write(".");
    emitChild(n, 0);
    break;
  case NodeKind::ConditionalAccess:
    emitChild(n, 0);
    write("?");
    emitChild(n, 1);
    break;
  case NodeKind::Invocation:
    emitChild(n, 0);
    emitChild(n, 1);
    break;
  case NodeKind::ObjectCreation:
    write("new ");
    for (size_t i = 0; i < n.children.size(); ++i) {
      if (auto* c = n.child(i); c && c->is(NodeKind::InitializerList)) write(" ");
      emitChild(n, i);
    }
    break;
  case NodeKind::ArrayCreation:
    write("new ");
    emitChild(n, 0);
    write(" ");
    emitChild(n, 1);
    break;
  case NodeKind::InitializerList:
    if (n.children.empty()) {
      write("{ }");
      break;
    }
    write("{ ");
    joinChildren(n, 0, ", ");
    write(" }");
    break;
  case NodeKind::CollectionLiteral:
    write("[");
    joinChildren(n, 0, ", ");
    write("]");
    break;
  case NodeKind::SpreadElement:
    write("..");
    emitChild(n, 0);
    break;
  case NodeKind::BinaryExpression:
    emitChild(n, 0);
    write(" "); write(n.text); write(" ");
    emitChild(n, 1);
    break;
  case NodeKind::Parenthesized:
    write("(");
    emitChild(n, 0);
    write(")");
    break;
  case NodeKind::Lambda:
    write(n.text); write(" => ");
    emitChild(n, 0);
    break;
  case NodeKind::InterpolatedString:
    write("$\"");
    joinChildren(n, 0, "");
    write("\"");
    break;
  case NodeKind::Interpolation:
    write("{");
    emitChild(n, 0);
    write("}");
    break;
  case NodeKind::Count_:
    break;
  }

  if (Sink) Sink(n, parent, begin, static_cast<unsigned>(Out.size()));
}

} // namespace lfx
