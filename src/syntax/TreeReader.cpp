#include "syntax/TreeReader.hpp"

#include <fstream>
#include <sstream>

namespace lfx {

namespace {

struct Form {
  bool isList = false;
  bool quoted = false;
  std::string atom;
  std::vector<Form> items;
  int line = 1, col = 1;

  bool isKeyword() const { return !isList && !quoted && atom.size() > 1 && atom[0] == ':'; }
  bool isAtom() const { return !isList; }
};

struct Reader {
  std::string_view d;
  size_t p = 0;
  int line = 1, col = 1;

  explicit Reader(std::string_view s) : d(s) {}
  bool eof() const { return p >= d.size(); }
  char peek() const { return eof() ? '\0' : d[p]; }
  char get() {
    if (eof()) return '\0';
    char c = d[p++];
    if (c == '\n') { ++line; col = 1; } else { ++col; }
    return c;
  }
  [[noreturn]] void fail(const std::string& what) const { throw TreeReadError(what, line, col); }

  void skipWs() {
    while (!eof()) {
      char c = peek();
      if (c == ';') {
        while (!eof() && get() != '\n') continue;
        continue;
      }
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ',') { get(); continue; }
      break;
    }
  }

  static bool isBare(char c) {
    return c != '\0' && c != '(' && c != ')' && c != '"' && c != ';' &&
           c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != ',';
  }

  Form parseForm() {
    skipWs();
    Form f;
    f.line = line; f.col = col;
    char c = peek();
    if (c == '(') {
      get();
      f.isList = true;
      skipWs();
      while (!eof() && peek() != ')') {
        f.items.push_back(parseForm());
        skipWs();
      }
      if (get() != ')') fail("unterminated form");
      return f;
    }
    if (c == '"') {
      get();
      f.quoted = true;
      while (true) {
        if (eof()) fail("unterminated string");
        char ch = get();
        if (ch == '"') break;
        if (ch == '\\') {
          if (eof()) fail("bad escape");
          char e = get();
          f.atom += e == 'n' ? '\n' : e == 't' ? '\t' : e;
        } else {
          f.atom += ch;
        }
      }
      return f;
    }
    if (c == ')') fail("unexpected ')'");
    while (isBare(peek())) f.atom += get();
    if (f.atom.empty()) fail("unexpected end of input");
    return f;
  }
};

[[noreturn]] void fail(const Form& at, const std::string& what) {
  throw TreeReadError(what, at.line, at.col);
}

const std::string& atomOf(const Form& f, const char* what) {
  if (!f.isAtom() || f.isKeyword()) fail(f, std::string("expected ") + what);
  return f.atom;
}

std::optional<SymbolKind> symbolKindFromName(const std::string& s) {
  if (s == "method") return SymbolKind::Method;
  if (s == "property") return SymbolKind::Property;
  if (s == "field") return SymbolKind::Field;
  if (s == "constructor") return SymbolKind::Constructor;
  if (s == "local") return SymbolKind::Local;
  if (s == "parameter") return SymbolKind::Parameter;
  return std::nullopt;
}

// Turns forms into nodes and declarations.
class Builder {
public:
  explicit Builder(SemanticIndex& idx) : Idx(idx) {}

  void declareType(const Form& f) {
    if (f.items.size() < 2) fail(f, "declare-type needs a name");
    const auto& name = atomOf(f.items[1], "type name");
    const TypeDescriptor* definition = nullptr;
    std::vector<const TypeDescriptor*> args;
    std::vector<const TypeDescriptor*> interfaces;
    for (size_t i = 2; i < f.items.size(); i += 2) {
      const auto& key = f.items[i];
      if (!key.isKeyword() || i + 1 >= f.items.size()) fail(key, "expected :key value");
      const auto& val = f.items[i + 1];
      if (key.atom == ":definition") {
        definition = &Idx.declareType(atomOf(val, "type name"));
      } else if (key.atom == ":args") {
        args = typeList(val);
      } else if (key.atom == ":implements") {
        for (auto* iface : typeList(val)) interfaces.push_back(iface);
      } else {
        fail(key, "unknown declare-type option " + key.atom);
      }
    }

    auto& t = definition ? Idx.declareConstructed(name, *definition, std::move(args))
                         : Idx.declareType(name);
    if (!definition && !args.empty()) t.typeArguments = std::move(args);
    t.interfaces.insert(t.interfaces.end(), interfaces.begin(), interfaces.end());
  }

  void declareMember(const Form& f) {
    if (f.items.size() < 3) fail(f, "declare-member needs an owner and a name");
    auto& owner = Idx.declareType(atomOf(f.items[1], "owner type"));
    const auto& name = atomOf(f.items[2], "member name");
    SymbolKind kind = SymbolKind::Method;
    const TypeDescriptor* type = nullptr;
    for (size_t i = 3; i < f.items.size(); i += 2) {
      const auto& key = f.items[i];
      if (!key.isKeyword() || i + 1 >= f.items.size()) fail(key, "expected :key value");
      const auto& val = f.items[i + 1];
      if (key.atom == ":kind") {
        auto k = symbolKindFromName(atomOf(val, "symbol kind"));
        if (!k) fail(val, "unknown symbol kind " + val.atom);
        kind = *k;
      } else if (key.atom == ":type") {
        type = &Idx.declareType(atomOf(val, "type name"));
      } else {
        fail(key, "unknown declare-member option " + key.atom);
      }
    }
    Idx.declareMember(owner, name, kind, type);
  }

  NodePtr node(const Form& f) {
    if (!f.isList || f.items.empty()) fail(f, "expected a node form");
    const auto& head = atomOf(f.items[0], "node kind");
    auto kind = kindFromName(head);
    if (!kind) fail(f.items[0], "unknown node kind '" + head + "'");

    std::string text;
    bool haveText = false;
    const Form* type = nullptr;
    const Form* symbol = nullptr;
    std::vector<NodePtr> children;

    for (size_t i = 1; i < f.items.size(); ++i) {
      const auto& it = f.items[i];
      if (it.isKeyword()) {
        if (i + 1 >= f.items.size()) fail(it, "missing value for " + it.atom);
        const auto& val = f.items[++i];
        if (it.atom == ":type") type = &val;
        else if (it.atom == ":symbol") symbol = &val;
        else fail(it, "unknown node option " + it.atom);
      } else if (it.isList) {
        children.push_back(node(it));
      } else if (!haveText && children.empty()) {
        text = it.atom;
        haveText = true;
      } else {
        fail(it, "unexpected atom '" + it.atom + "' in " + kindName(*kind));
      }
    }

    auto n = makeNode(*kind, std::move(text), std::move(children));
    if (type) Idx.bindType(*n, Idx.declareType(atomOf(*type, "type name")));
    if (symbol) {
      const auto& q = atomOf(*symbol, "member reference");
      auto* sym = Idx.findMember(q);
      if (!sym) fail(*symbol, "unknown member " + q);
      Idx.bindSymbol(*n, *sym);
    }
    return n;
  }

private:
  std::vector<const TypeDescriptor*> typeList(const Form& f) {
    std::vector<const TypeDescriptor*> out;
    if (!f.isList) {
      out.push_back(&Idx.declareType(atomOf(f, "type name")));
      return out;
    }
    for (const auto& item : f.items) out.push_back(&Idx.declareType(atomOf(item, "type name")));
    return out;
  }

  SemanticIndex& Idx;
};

} // namespace

TreeFile readTree(std::string_view src, std::string path) {
  TreeFile out;
  out.semantics = std::make_unique<SemanticIndex>();
  Builder b(*out.semantics);

  Reader r(src);
  NodePtr root;
  for (r.skipWs(); !r.eof(); r.skipWs()) {
    Form f = r.parseForm();
    if (!f.isList || f.items.empty()) fail(f, "expected a top-level form");
    const auto& head = f.items[0].atom;
    if (head == "declare-type") {
      b.declareType(f);
    } else if (head == "declare-member") {
      b.declareMember(f);
    } else if (head == "source") {
      if (f.items.size() != 2) fail(f, "source takes one path");
      path = atomOf(f.items[1], "source path");
    } else {
      if (root) fail(f, "more than one syntax root");
      root = b.node(f);
    }
  }
  if (!root) throw TreeReadError("no syntax root", r.line, r.col);

  out.tree = std::make_unique<SyntaxTree>(std::move(root), std::move(path));
  return out;
}

static bool readFile(const std::string& path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  std::ostringstream ss; ss << ifs.rdbuf(); out = ss.str();
  return true;
}

bool readTreeFile(const std::string& path, TreeFile& out, std::string* error) {
  std::string content;
  if (!readFile(path, content)) {
    if (error) *error = "Failed to read " + path;
    return false;
  }
  try {
    out = readTree(content, path);
  } catch (const TreeReadError& e) {
    if (error) *error = path + ":" + e.what();
    return false;
  }
  return true;
}

} // namespace lfx
